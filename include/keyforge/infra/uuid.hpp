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
 * @file uuid.hpp
 * @brief Random (Version 4) UUID source used by the `UUID` key generator.
 *
 * @details
 * Keys built from UUIDs only need to be unique, not secret. The generator therefore
 * draws from a per-thread Mersenne Twister seeded by `std::random_device` instead of
 * an operating system CSPRNG.
 */

#pragma once

#include <string>

namespace keyforge::infra {

/**
 * @class Uuid
 * @brief A static utility producing canonical RFC 4122 Version 4 UUID strings.
 */
class Uuid {
  public:
    /**
     * @brief Generates a random Version 4 UUID.
     *
     * The output uses the canonical lowercase textual form
     * `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` (36 characters), where `y` is one of
     * `{8, 9, a, b}` (RFC 4122 variant).
     *
     * @note Thread-safe: every thread owns its own engine.
     *
     * @code
     * std::string key = keyforge::infra::Uuid::generate_v4();
     * // "67a7f0a4-99a5-4607-b275-c3b436250ad2"
     * @endcode
     */
    static std::string generate_v4();
};

} // namespace keyforge::infra
