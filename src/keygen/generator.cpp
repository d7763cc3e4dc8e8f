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
 * @file generator.cpp
 * @brief Runtime behaviour of each generator kind.
 */

#include "keyforge/keygen/generator.hpp"

#include "keyforge/infra/json.hpp"
#include "keyforge/infra/uuid.hpp"
#include "keyforge/keygen/errors.hpp"

namespace keyforge::keygen {

namespace {

struct FragmentVisitor {
    const cJSON* document;

    std::string operator()(TextGenerator& generator) const
    {
        return generator.text;
    }

    /**
     * An empty string value is a valid fragment here; only the key as a whole must be
     * non-empty.
     */
    std::string operator()(FieldGenerator& generator) const
    {
        infra::LookupResult result = infra::Json::lookup(document, generator.path.segments());

        switch (result.kind) {
        case infra::JsonKind::ABSENT:
            throw ResultError("resulting field does not exist");
        case infra::JsonKind::NULL_VALUE:
            throw ResultError("resulting field is null");
        case infra::JsonKind::ARRAY:
        case infra::JsonKind::OBJECT:
            throw ResultError("resulting field is a JSON array/object");
        case infra::JsonKind::SCALAR:
            break;
        }

        return result.scalar;
    }

    std::string operator()(MonoIncrGenerator& generator) const
    {
        return std::to_string(generator.next++);
    }

    std::string operator()(UuidGenerator&) const
    {
        return infra::Uuid::generate_v4();
    }
};

} // namespace

std::string next_fragment(Generator& generator, const cJSON* document)
{
    return std::visit(FragmentVisitor{document}, generator);
}

bool reads_document(const Generator& generator)
{
    return std::holds_alternative<FieldGenerator>(generator);
}

} // namespace keyforge::keygen
