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
 * @file field_path.cpp
 * @brief Field path grammar and in-place field removal.
 *
 * @details
 * The parser is a two-state machine. In the *not-open* state a `.` terminates the current
 * segment and a lone backtick opens a quoted run; in the *open* state everything except
 * a lone backtick is literal. A doubled backtick is a literal backtick in both states.
 */

#include "keyforge/keygen/field_path.hpp"

#include "keyforge/keygen/delimiters.hpp"
#include "keyforge/keygen/errors.hpp"

#include <utility>

namespace keyforge::keygen {

namespace {

/// One step of the state machine: the text to append, the bytes consumed, the next state.
struct Step {
    std::string text;
    std::size_t consumed;
    bool open;
};

bool next_is_backtick(const std::string& path, std::size_t idx)
{
    return idx + 1 < path.size() && path[idx + 1] == BACKTICK;
}

Step parse_open(const std::string& path, std::size_t idx)
{
    if (path[idx] != BACKTICK) {
        return {std::string(1, path[idx]), 1, true};
    }

    if (next_is_backtick(path, idx)) {
        return {"`", 2, true};
    }

    // Closing backtick.
    return {"", 1, false};
}

/**
 * @brief Not-open state. A zero `consumed` signals the end of the current segment.
 */
Step parse_not_open(const std::string& path, std::size_t idx)
{
    switch (path[idx]) {
    case PERIOD:
        if (idx == 0 || path[idx - 1] == PERIOD) {
            throw FieldPathError("empty field name");
        }
        return {"", 0, false};
    case BACKTICK:
        if (next_is_backtick(path, idx)) {
            return {"`", 2, false};
        }
        return {"", 1, true};
    default:
        return {std::string(1, path[idx]), 1, false};
    }
}

/**
 * @brief Parses the segment starting at `idx`.
 *
 * @return The segment and the number of bytes to advance, including the terminating `.`.
 */
std::pair<std::string, std::size_t> parse_segment(const std::string& path, std::size_t idx)
{
    std::size_t start = idx;
    bool open = false;
    std::string segment;

    while (idx < path.size()) {
        Step step = open ? parse_open(path, idx) : parse_not_open(path, idx);
        if (step.consumed == 0) {
            break;
        }

        segment += step.text;
        idx += step.consumed;
        open = step.open;
    }

    if (open) {
        throw FieldPathError("unbalanced backticks");
    }

    return {segment, idx - start + 1};
}

} // namespace

FieldPath::FieldPath(std::vector<std::string> segments) : segments_(std::move(segments)) {}

FieldPath FieldPath::parse(const std::string& path)
{
    if (path.empty()) {
        throw FieldPathError("empty field name");
    }

    if (path[0] == PERIOD) {
        throw FieldPathError("cannot find nested object of field without name");
    }

    std::vector<std::string> segments;
    std::size_t idx = 0;
    while (idx < path.size()) {
        auto [segment, consumed] = parse_segment(path, idx);
        segments.push_back(std::move(segment));
        idx += consumed;
    }

    return FieldPath(std::move(segments));
}

void FieldPath::remove_from(cJSON* object) const
{
    if (!cJSON_IsObject(object)) {
        return;
    }

    cJSON* current = object;
    for (std::size_t i = 0; i + 1 < segments_.size(); ++i) {
        cJSON* value = cJSON_GetObjectItemCaseSensitive(current, segments_[i].c_str());
        if (!cJSON_IsObject(value)) {
            return;
        }
        current = value;
    }

    cJSON_DeleteItemFromObjectCaseSensitive(current, segments_.back().c_str());
}

} // namespace keyforge::keygen
