#include "certvault/storage_keys.h"

#include <gtest/gtest.h>

namespace certvault::keys {

TEST(StorageKeysTest, SafeLowercasesAndTrims) {
  EXPECT_EQ(Safe("  Example.COM "), "example.com");
}

TEST(StorageKeysTest, SafeReplacesSpecialCharacters) {
  EXPECT_EQ(Safe("*.example.com"), "wildcard_.example.com");
  EXPECT_EQ(Safe("a b"), "a_b");
  EXPECT_EQ(Safe("a+b"), "a_plus_b");
  EXPECT_EQ(Safe("host:443"), "host-443");
}

TEST(StorageKeysTest, SafeStripsPathTraversal) {
  EXPECT_EQ(Safe("../../etc/passwd"), "etcpasswd");
  EXPECT_EQ(Safe("a/b\\c"), "abc");
}

TEST(StorageKeysTest, BuildsSiteKeys) {
  const std::string issuer = "acme-v02.api.letsencrypt.org-directory";
  EXPECT_EQ(CertsPrefix(issuer),
            "certificates/acme-v02.api.letsencrypt.org-directory");
  EXPECT_EQ(SiteCert(issuer, "example.com"),
            "certificates/acme-v02.api.letsencrypt.org-directory/example.com/"
            "example.com.crt");
  EXPECT_EQ(SitePrivateKey(issuer, "example.com"),
            "certificates/acme-v02.api.letsencrypt.org-directory/example.com/"
            "example.com.key");
  EXPECT_EQ(SiteMeta(issuer, "example.com"),
            "certificates/acme-v02.api.letsencrypt.org-directory/example.com/"
            "example.com.json");
  EXPECT_EQ(SiteBundle(issuer, "example.com"),
            "certificates/acme-v02.api.letsencrypt.org-directory/example.com/"
            "example.com.bundle.json");
}

TEST(StorageKeysTest, WildcardSiteKeys) {
  EXPECT_EQ(SiteBundle("ca", "*.example.com"),
            "certificates/ca/wildcard_.example.com/"
            "wildcard_.example.com.bundle.json");
}

}  // namespace certvault::keys
