/**
 * @file RecordId.cpp
 * @brief SHA-256 based record identifiers using OpenSSL EVP
 */

#include "RecordId.hpp"
#include "Errors.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace fleetsense {

std::string RecordId::sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw ComputationError("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw ComputationError("SHA-256 digest failed");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string RecordId::fromParts(std::initializer_list<std::string> parts) {
    std::string joined;
    bool first = true;
    for (const auto& part : parts) {
        if (!first) {
            joined += '|';
        }
        joined += part;
        first = false;
    }

    std::string hex = sha256Hex(joined).substr(0, 32);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace fleetsense
