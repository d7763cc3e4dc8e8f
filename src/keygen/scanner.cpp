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
 * @file scanner.cpp
 * @brief Implementation of the expression scanning primitives.
 */

#include "keyforge/keygen/scanner.hpp"

namespace keyforge::keygen {

std::optional<char> Scanner::peek_next(const std::string& exp, std::size_t idx)
{
    if (exp.size() > idx + 1) {
        return exp[idx + 1];
    }

    return std::nullopt;
}

bool Scanner::should_parse(const std::string& exp, std::size_t idx, char del)
{
    auto next = peek_next(exp, idx);
    return next.has_value() && exp[idx] == del && *next != del;
}

/**
 * @brief Left-to-right, non-overlapping replacement of `del del` with `del`.
 *
 * A run of four delimiters therefore collapses to two, never to one.
 */
std::string Scanner::unescape(const std::string& exp, char del)
{
    std::string out;
    out.reserve(exp.size());

    std::size_t idx = 0;
    while (idx < exp.size()) {
        out.push_back(exp[idx]);

        if (exp[idx] == del && idx + 1 < exp.size() && exp[idx + 1] == del) {
            idx += 2;
            continue;
        }

        idx++;
    }

    return out;
}

std::string Scanner::unescape(const std::string& exp, char field_del, char generator_del)
{
    return unescape(unescape(exp, field_del), generator_del);
}

std::string Scanner::start_at_end_message(char current, char generator_del)
{
    if (current == generator_del) {
        return "start of generator at end of expression";
    }

    return "start of field at end of expression";
}

} // namespace keyforge::keygen
