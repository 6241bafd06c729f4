/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string_view>

namespace hashduel::crypto {

// Challenges are counted in leading zero hex characters of the SHA-1 digest.
inline constexpr int kMinChallenge = 1;
inline constexpr int kMaxChallenge = 20;

inline bool is_valid_challenge(int challenge) {
    return challenge >= kMinChallenge && challenge <= kMaxChallenge;
}

// Number of leading '0' characters in a hex string
int leading_zero_nibbles(std::string_view hex);

// True iff sha1_hex(candidate) starts with `challenge` zeros. Empty candidates never pass.
// The challenge range is the caller's responsibility.
bool verify(int challenge, std::string_view candidate);

} // namespace hashduel::crypto
