#pragma once

#include <filesystem>
#include <mutex>

#include "fedrelay/store/model_store.hpp"

namespace fedrelay::store {

/**
 * Directory-backed model store.
 *
 * Objects live at <root>/<key>; headers of the last write are kept beside the
 * object as <key>.meta.json. Writes go to a temporary file in the same
 * directory and are renamed into place, so readers see either the previous
 * object or the complete new one.
 */
class FileModelStore : public ModelStore {
public:
    explicit FileModelStore(std::filesystem::path root);

    FetchResult get(const std::string& key) override;
    PutResult put(const std::string& key, const Bytes& bytes, const Headers& headers) override;
    std::string describe() const override;

    // Headers stored with the last successful put, empty if none.
    Headers headers(const std::string& key) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path resolve(const std::string& key) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

} // namespace fedrelay::store
