#pragma once

#include <optional>
#include <string>

namespace equipstat {

struct StoredFile {
    std::string path;       // store-relative
    std::string sha256;     // hex digest of the content
};

/**
 * @brief Storage for raw uploaded tables
 *
 * save() throws StoreError on failure; read() and remove() report a missing
 * file through their return value.
 */
class IFileStore {
public:
    virtual ~IFileStore() = default;

    virtual StoredFile save(const std::string& original_name, const std::string& content) = 0;

    [[nodiscard]] virtual std::optional<std::string> read(const std::string& path) = 0;

    /// @return true if the file existed
    virtual bool remove(const std::string& path) = 0;
};

} // namespace equipstat
