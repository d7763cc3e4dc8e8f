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
 * @file key_generator.cpp
 * @brief Expression compiler and pipeline evaluation.
 *
 * @details
 * The compiler scans the expression from left to right. At every position it decides
 * between three units:
 * 1. **Field**: an unescaped field delimiter followed by anything but itself.
 * 2. **Generator**: the same, with the generator delimiter.
 * 3. **Text**: everything else, up to the next unescaped delimiter.
 *
 * Error positions are byte offsets into the expression and are reported exactly as
 * computed below; tooling relies on them to point at the offending character.
 */

#include "keyforge/keygen/key_generator.hpp"

#include "keyforge/infra/json.hpp"
#include "keyforge/infra/logger.hpp"
#include "keyforge/keygen/errors.hpp"
#include "keyforge/keygen/scanner.hpp"

#include <optional>
#include <regex>
#include <stdexcept>
#include <utility>

namespace keyforge::keygen {

namespace {

/// A compiled unit and the number of expression bytes it consumed (delimiters excluded).
struct Parsed {
    Generator generator;
    std::size_t consumed;
};

/**
 * @brief Parses `MONO_INCR` or `MONO_INCR[N]`.
 *
 * @param token The generator body.
 * @param offset Position of the body, used for error reporting.
 * @return std::nullopt If the token is not a `MONO_INCR` token at all.
 */
std::optional<MonoIncrGenerator> parse_mono_incr(const std::string& token, std::size_t offset)
{
    static const std::regex pattern(R"(^MONO_INCR(\[([+-]?\d+)\])?$)");

    std::smatch match;
    if (!std::regex_match(token, match, pattern)) {
        return std::nullopt;
    }

    MonoIncrGenerator generator;
    if (!match[2].matched) {
        return generator;
    }

    std::string start = match[2].str();
    if (start[0] == '-') {
        return generator;
    }

    try {
        uint64_t value = std::stoull(start);
        if (value > 0) {
            generator.next = value;
        }
    } catch (const std::out_of_range&) {
        throw ExpressionError(offset, "failed to parse MONO_INCR start point '" + start + "'");
    }

    return generator;
}

/**
 * @brief Parses a field reference whose body starts at `start`.
 *
 * Doubled field delimiters inside the body are escapes; the first single delimiter
 * closes the reference.
 */
Parsed parse_field(const std::string& exp, std::size_t start, char field_del)
{
    std::size_t idx = start;
    while (idx < exp.size()) {
        if (exp[idx] != field_del) {
            idx++;
            continue;
        }

        if (idx + 1 < exp.size() && exp[idx + 1] == field_del) {
            idx += 2;
            continue;
        }

        std::string path = Scanner::unescape(exp.substr(start, idx - start), field_del);
        return {FieldGenerator{FieldPath::parse(path)}, idx - start};
    }

    throw ExpressionError(idx, "unclosed field at end of expression");
}

/**
 * @brief Parses a generator token whose body starts at `start`.
 *
 * Generator bodies do not support escapes, the first generator delimiter closes them.
 */
Parsed parse_generator(const std::string& exp, std::size_t start, char field_del,
                       char generator_del)
{
    std::size_t idx = start;
    bool finished = false;

    while (idx < exp.size()) {
        if (exp[idx] == generator_del) {
            finished = true;
            break;
        }

        if (exp[idx] == field_del) {
            throw ExpressionError(idx, "attempting to start a field inside a generator");
        }

        idx++;
    }

    if (!finished) {
        throw ExpressionError(idx, "unclosed generator at end of expression");
    }

    std::string token = exp.substr(start, idx - start);

    if (auto mono = parse_mono_incr(token, start)) {
        return {*mono, idx - start};
    }

    if (token == "UUID") {
        return {UuidGenerator{}, idx - start};
    }

    throw ExpressionError(start, "invalid generator");
}

/**
 * @brief Parses literal text starting at `start`.
 *
 * Stops in front of the next delimiter that is not doubled. A delimiter in last position
 * is ambiguous (escape or reference) and is rejected.
 */
Parsed parse_text(const std::string& exp, std::size_t start, char field_del, char generator_del)
{
    std::size_t idx = start;
    std::size_t end = start;

    while (idx < exp.size()) {
        char current = exp[idx];
        if (current != field_del && current != generator_del) {
            idx++;
            end = idx;
            continue;
        }

        auto next = Scanner::peek_next(exp, idx);
        if (!next) {
            throw ExpressionError(idx + 1, Scanner::start_at_end_message(current, generator_del));
        }

        if (*next != current) {
            break;
        }

        idx += 2;
        end = idx;
    }

    std::string text = Scanner::unescape(exp.substr(start, end - start), field_del, generator_del);
    return {TextGenerator{text}, end - start};
}

} // namespace

KeyGenerator::KeyGenerator(const std::string& expression, const Delimiters& delimiters)
    : delimiters_(delimiters)
{
    validate_delimiters(delimiters_);

    if (expression.empty()) {
        throw EmptyExpressionError();
    }

    compile(expression);
}

KeyGenerator::KeyGenerator(const std::string& expression, char field_delimiter,
                           char generator_delimiter)
    : KeyGenerator(expression, Delimiters{field_delimiter, generator_delimiter})
{
}

void KeyGenerator::compile(const std::string& expression)
{
    const char field_del = delimiters_.field;
    const char generator_del = delimiters_.generator;

    std::size_t idx = 0;
    while (idx < expression.size()) {
        if (Scanner::should_parse(expression, idx, field_del)) {
            Parsed parsed = parse_field(expression, idx + 1, field_del);
            generators_.push_back(std::move(parsed.generator));
            idx += parsed.consumed + 2;
        } else if (Scanner::should_parse(expression, idx, generator_del)) {
            Parsed parsed = parse_generator(expression, idx + 1, field_del, generator_del);
            generators_.push_back(std::move(parsed.generator));
            idx += parsed.consumed + 2;
        } else {
            Parsed parsed = parse_text(expression, idx, field_del, generator_del);
            generators_.push_back(std::move(parsed.generator));
            idx += parsed.consumed;
        }
    }

    for (const auto& generator : generators_) {
        if (reads_document(generator)) {
            reads_document_ = true;
            break;
        }
    }

    if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "KeyGen: Compiled '" + expression + "' into " +
                               std::to_string(generators_.size()) + " generator(s)");
    }
}

std::string KeyGenerator::next(const std::string& document)
{
    infra::ScopedJson root;
    if (reads_document_) {
        root = infra::Json::parse(document);
    }

    std::string key;
    for (auto& generator : generators_) {
        key += next_fragment(generator, root.get());
    }

    if (key.empty()) {
        throw ResultError("generated key is an empty string");
    }

    if (key.size() > MAX_KEY_SIZE) {
        throw ResultError("generated key is larger than " + std::to_string(MAX_KEY_SIZE) +
                          " bytes");
    }

    return key;
}

} // namespace keyforge::keygen
