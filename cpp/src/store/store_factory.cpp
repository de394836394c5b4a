#include "fedrelay/store/store_factory.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"
#include "fedrelay/store/file_model_store.hpp"
#include "fedrelay/store/http_model_store.hpp"
#include "fedrelay/store/pg_model_store.hpp"

namespace fedrelay::store {

std::shared_ptr<ModelStore> make_store(const StorageConfig& config) {
    std::shared_ptr<ModelStore> store;

    if (config.backend == "http") {
        HttpStoreOptions options;
        options.base_url = config.base_url;
        options.bearer_token = config.bearer_token;
        options.timeout = std::chrono::milliseconds(config.timeout_ms);
        options.max_body_bytes = static_cast<uint64_t>(config.max_body_bytes);
        store = std::make_shared<HttpModelStore>(options);
    } else if (config.backend == "filesystem") {
        store = std::make_shared<FileModelStore>(config.root);
    } else if (config.backend == "postgres") {
        auto pg = std::make_shared<PgModelStore>(config.conninfo, config.table);
        pg->ensure_schema();
        store = pg;
    } else {
        throw InvalidParameterError("Unknown storage backend '" + config.backend + "'", "make_store",
                                    "Use one of: http, filesystem, postgres");
    }

    LOG_INFO("Model store: {}", store->describe());
    return store;
}

} // namespace fedrelay::store
