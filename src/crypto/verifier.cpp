/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/crypto/verifier.hpp>
#include <hashduel/crypto/sha1.hpp>

#include <string>

namespace hashduel::crypto {

int leading_zero_nibbles(std::string_view hex) {
    int count = 0;
    for (char c : hex) {
        if (c != '0') break;
        ++count;
    }
    return count;
}

bool verify(int challenge, std::string_view candidate) {
    if (candidate.empty()) return false;
    const std::string hex = sha1_hex(candidate);
    if (challenge > static_cast<int>(hex.size())) return false;
    return leading_zero_nibbles(hex) >= challenge;
}

} // namespace hashduel::crypto
