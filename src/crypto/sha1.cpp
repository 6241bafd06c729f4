/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "hashduel/crypto/sha1.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace hashduel {
namespace crypto {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

Sha1Digest sha1(const std::uint8_t* data, std::size_t len) {
    Sha1Digest digest{};
    unsigned int out_len = static_cast<unsigned int>(digest.size());

    std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA1");
    }
    if (EVP_DigestUpdate(ctx.get(), data, len) != 1) {
        throw std::runtime_error("Failed to update SHA1");
    }
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &out_len) != 1) {
        throw std::runtime_error("Failed to finalize SHA1");
    }
    return digest;
}

Sha1Digest sha1(std::string_view data) {
    return sha1(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::string to_hex(const std::uint8_t* data, std::size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string sha1_hex(std::string_view data) {
    const auto digest = sha1(data);
    return to_hex(digest.data(), digest.size());
}

} // namespace crypto
} // namespace hashduel
