#include "storage/digest.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace equipstat {

std::string sha256_hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return utils::bytes_to_hex(hash, hash_len);
}

} // namespace equipstat
