#pragma once

#include <memory>
#include <string>

#include "certvault/storage/storage.h"

namespace certvault::storage {

std::shared_ptr<Storage> CreateFileStorage(std::string root);
std::shared_ptr<Storage> CreateRedisStorage(std::string uri,
                                            std::string key_namespace);

}  // namespace certvault::storage
