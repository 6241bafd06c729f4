/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hashduel {
namespace crypto {

using Sha1Digest = std::array<std::uint8_t, 20>;

/**
 * Compute the SHA-1 digest of a byte range
 * @param data Input bytes
 * @param len Number of bytes
 * @return 20-byte digest
 * @throws std::runtime_error if the OpenSSL digest context fails
 */
Sha1Digest sha1(const std::uint8_t* data, std::size_t len);

/**
 * Compute the SHA-1 digest of a string's raw bytes
 */
Sha1Digest sha1(std::string_view data);

/**
 * Lowercase hexadecimal rendering of a byte range
 */
std::string to_hex(const std::uint8_t* data, std::size_t len);

/**
 * Lowercase hexadecimal SHA-1 of a string (40 characters)
 */
std::string sha1_hex(std::string_view data);

} // namespace crypto
} // namespace hashduel
