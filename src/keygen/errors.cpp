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
 * @file errors.cpp
 * @brief Message rendering for the key generation exception hierarchy.
 */

#include "keyforge/keygen/errors.hpp"

namespace keyforge::keygen {

ExpressionError::ExpressionError(std::size_t index, const std::string& reason)
    : ExpressionError("error in key expression at char " + std::to_string(index) + ", " + reason,
                      index, reason)
{
}

ExpressionError::ExpressionError(const std::string& message, std::size_t index,
                                 const std::string& reason)
    : KeyGenError(message), index_(index), reason_(reason)
{
}

EmptyExpressionError::EmptyExpressionError()
    : ExpressionError("key generator contains an empty expression", 0, "empty expression")
{
}

ResultError::ResultError(const std::string& reason)
    : KeyGenError("key generation for document failed, " + reason), reason_(reason)
{
}

} // namespace keyforge::keygen
