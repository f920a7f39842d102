#pragma once

#include <string>

namespace equipstat {

/**
 * @brief Lowercase hex SHA-256 of a buffer (OpenSSL EVP)
 * @throws std::runtime_error if the digest cannot be computed
 */
[[nodiscard]] std::string sha256_hex(const std::string& data);

} // namespace equipstat
