/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file uuid.cpp
 * @brief Implementation of the Version 4 UUID source.
 */

#include "keyforge/infra/uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace keyforge::infra {

/**
 * @brief Fills 16 random bytes, stamps the version and variant bits, then renders them
 * as five dash-separated hexadecimal groups (8-4-4-4-12).
 */
std::string Uuid::generate_v4()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, 16> bytes{};
    for (std::size_t half = 0; half < 2; ++half) {
        uint64_t sample = dis(gen);
        for (std::size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(sample >> (56 - 8 * i));
        }
    }

    // Version 4 in the high nibble of byte 6, variant 10xx in byte 8.
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static const char* hex = "0123456789abcdef";

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }

    return out;
}

} // namespace keyforge::infra
