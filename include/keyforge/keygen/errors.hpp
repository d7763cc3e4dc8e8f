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
 * @file errors.hpp
 * @brief Exception hierarchy raised by the key generation subsystem.
 *
 * @details
 * Key generation fails in three distinct phases, and callers are expected to react
 * differently to each of them:
 * 1. **Compilation** (`ExpressionError`, `FieldPathError`, `DelimiterError`): the
 *    expression itself is unusable and must be fixed before anything can be generated.
 * 2. **Evaluation** (`ResultError`): a single document could not produce a key. This is a
 *    routine outcome for "bad" documents; batch processing should catch it and continue.
 * 3. **Configuration** (`ConfigError`): the keyer options document is malformed.
 *
 * Every type derives from `KeyGenError`, itself a `std::runtime_error`, so generic
 * `std::exception` handlers keep working.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace keyforge::keygen {

/**
 * @class KeyGenError
 * @brief Common base of every error raised by the key generation subsystem.
 */
class KeyGenError : public std::runtime_error {
  public:
    explicit KeyGenError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ExpressionError
 * @brief Syntax error in a key expression.
 *
 * Carries the character index at which the problem was detected along with a short
 * human-readable reason. The rendered message reads:
 * `error in key expression at char <index>, <reason>`.
 */
class ExpressionError : public KeyGenError {
  public:
    ExpressionError(std::size_t index, const std::string& reason);

    /// The character index at which the error was detected.
    std::size_t index() const
    {
        return index_;
    }

    /// The reason, without the positional prefix.
    const std::string& reason() const
    {
        return reason_;
    }

  protected:
    /// Used by subclasses which render their own message.
    ExpressionError(const std::string& message, std::size_t index, const std::string& reason);

  private:
    std::size_t index_;
    std::string reason_;
};

/**
 * @class EmptyExpressionError
 * @brief Raised when the caller supplies an empty key expression.
 */
class EmptyExpressionError : public ExpressionError {
  public:
    EmptyExpressionError();
};

/**
 * @class FieldPathError
 * @brief A field path could not be parsed (unbalanced backticks, empty segment, ...).
 *
 * Raised by `FieldPath::parse`, therefore it can surface both while compiling an expression
 * and when a path is parsed directly (e.g. for field removal).
 */
class FieldPathError : public KeyGenError {
  public:
    explicit FieldPathError(const std::string& reason) : KeyGenError(reason) {}
};

/**
 * @class ResultError
 * @brief Key generation failed for one specific document.
 *
 * The rendered message reads: `key generation for document failed, <reason>`.
 */
class ResultError : public KeyGenError {
  public:
    explicit ResultError(const std::string& reason);

    const std::string& reason() const
    {
        return reason_;
    }

  private:
    std::string reason_;
};

/**
 * @class DelimiterError
 * @brief The field/generator delimiter pair is unusable.
 */
class DelimiterError : public KeyGenError {
  public:
    explicit DelimiterError(const std::string& reason) : KeyGenError(reason) {}
};

/**
 * @class ConfigError
 * @brief A keyer configuration document is malformed.
 */
class ConfigError : public KeyGenError {
  public:
    explicit ConfigError(const std::string& reason) : KeyGenError(reason) {}
};

} // namespace keyforge::keygen
