#include "storage/local_file_store.hpp"
#include "storage/digest.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace equipstat {

namespace fs = std::filesystem;

LocalFileStore::LocalFileStore(fs::path root)
    : root_(std::move(root)) {}

std::string LocalFileStore::sanitize_name(const std::string& name) {
    const std::string base = fs::path(name).filename().string();
    std::string out;
    out.reserve(base.size());
    for (const char c : base) {
        const auto uc = static_cast<unsigned char>(c);
        out += (std::isalnum(uc) || c == '.' || c == '-' || c == '_') ? c : '_';
    }
    return out.empty() ? "upload.csv" : out;
}

std::optional<fs::path> LocalFileStore::resolve(const std::string& path) const {
    const fs::path rel(path);
    if (rel.empty() || rel.is_absolute()) return std::nullopt;
    for (const auto& part : rel) {
        if (part == "..") return std::nullopt;
    }
    return root_ / rel;
}

StoredFile LocalFileStore::save(const std::string& original_name, const std::string& content) {
    const fs::path dir = root_ / "uploads";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StoreError(std::format("Cannot create upload directory {}: {}",
                                     dir.string(), ec.message()));
    }

    const std::string file_name =
        std::format("{}_{}", utils::generate_uuid(), sanitize_name(original_name));
    const fs::path target = dir / file_name;
    const fs::path temp = dir / (file_name + ".tmp");

    // Readers never see a partially written upload
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StoreError(std::format("Cannot open {} for writing", temp.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        fs::remove(temp, ec);
        throw StoreError(std::format("Failed writing {}", temp.string()));
    }

    fs::rename(temp, target, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(temp, ec);
        throw StoreError(std::format("Cannot move upload into place at {}: {}",
                                     target.string(), reason));
    }

    return StoredFile{(fs::path("uploads") / file_name).string(), sha256_hex(content)};
}

std::optional<std::string> LocalFileStore::read(const std::string& path) {
    const auto full = resolve(path);
    if (!full) return std::nullopt;

    std::ifstream in(*full, std::ios::binary);
    if (!in) return std::nullopt;

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool LocalFileStore::remove(const std::string& path) {
    const auto full = resolve(path);
    if (!full) return false;

    std::error_code ec;
    const bool removed = fs::remove(*full, ec);
    if (ec) {
        utils::log::warn(std::format("Failed to remove {}: {}", full->string(), ec.message()));
        return false;
    }
    return removed;
}

} // namespace equipstat
