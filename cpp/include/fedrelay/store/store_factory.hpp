#pragma once

#include <memory>

#include "fedrelay/config.hpp"
#include "fedrelay/store/model_store.hpp"

namespace fedrelay::store {

// Builds the backend named by storage.backend. The postgres backend also
// creates its table if missing.
std::shared_ptr<ModelStore> make_store(const StorageConfig& config);

} // namespace fedrelay::store
