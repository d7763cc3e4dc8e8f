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
 * @file document_keyer.cpp
 * @brief Implementation of the per-document keying loop.
 */

#include "keyforge/keygen/document_keyer.hpp"

#include "keyforge/infra/json.hpp"
#include "keyforge/infra/logger.hpp"
#include "keyforge/keygen/errors.hpp"

namespace keyforge::keygen {

DocumentKeyer::DocumentKeyer(const KeyerOptions& options)
    : generator_(options.expression, options.delimiters)
{
    ignore_fields_.reserve(options.ignore_fields.size());
    for (const auto& field : options.ignore_fields) {
        ignore_fields_.push_back(FieldPath::parse(field));
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Keyer: Configured with expression '" + options.expression + "' and " +
                           std::to_string(ignore_fields_.size()) + " ignored field(s)");
}

std::optional<KeyedDocument> DocumentKeyer::process(const std::string& document)
{
    std::size_t ordinal = processed_ + skipped_ + 1;

    try {
        KeyedDocument keyed = key_document(document);
        processed_++;
        return keyed;
    } catch (const ResultError& e) {
        skipped_++;
        infra::Logger::log(infra::LogLevel::WARN,
                           "Keyer: Skipping document #" + std::to_string(ordinal) + ": " +
                               e.what());
        return std::nullopt;
    }
}

KeyedDocument DocumentKeyer::key_document(const std::string& document)
{
    KeyedDocument keyed;
    keyed.key = generator_.next(document);

    if (ignore_fields_.empty()) {
        keyed.body = document;
        return keyed;
    }

    infra::ScopedJson root = infra::Json::parse(document);
    if (!cJSON_IsObject(root.get())) {
        throw ResultError("document is not a JSON object");
    }

    for (const auto& field : ignore_fields_) {
        field.remove_from(root.get());
    }

    keyed.body = infra::Json::serialize(root.get());
    return keyed;
}

} // namespace keyforge::keygen
