#pragma once

#include "storage/ifile_store.hpp"

#include <filesystem>

namespace equipstat {

/**
 * @brief IFileStore on a local directory
 *
 * Files are written as <root>/uploads/<uuid>_<name>, where name is the
 * original file name reduced to [A-Za-z0-9._-]. Paths handed out are
 * relative to root; paths escaping root are rejected.
 */
class LocalFileStore : public IFileStore {
public:
    explicit LocalFileStore(std::filesystem::path root);

    StoredFile save(const std::string& original_name, const std::string& content) override;

    std::optional<std::string> read(const std::string& path) override;

    bool remove(const std::string& path) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    [[nodiscard]] std::optional<std::filesystem::path> resolve(const std::string& path) const;

    [[nodiscard]] static std::string sanitize_name(const std::string& name);

    std::filesystem::path root_;
};

} // namespace equipstat
