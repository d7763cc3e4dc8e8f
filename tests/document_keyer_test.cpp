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
 * @file document_keyer_test.cpp
 * @brief Tests for keyer configuration loading and per-document keying.
 */

#include "framework.hpp"
#include "keyforge/infra/logger.hpp"
#include "keyforge/keygen/document_keyer.hpp"
#include "keyforge/keygen/errors.hpp"

#include <string>
#include <vector>

using keyforge::infra::LogLevel;
using keyforge::infra::Logger;
using keyforge::keygen::ConfigError;
using keyforge::keygen::DelimiterError;
using keyforge::keygen::DocumentKeyer;
using keyforge::keygen::ExpressionError;
using keyforge::keygen::FieldPathError;
using keyforge::keygen::KeyerOptions;

namespace {

/**
 * @class QuietLogs
 * @brief RAII guard raising the log threshold so expected WARN lines stay off the console.
 */
class QuietLogs {
  public:
    QuietLogs() : previous_(Logger::level())
    {
        Logger::set_level(LogLevel::ERROR);
    }

    ~QuietLogs()
    {
        Logger::set_level(previous_);
    }

  private:
    LogLevel previous_;
};

} // namespace

void test_options_from_json()
{
    KeyerOptions opts = KeyerOptions::from_json(
        R"({"key": "user::?id?", "field_delimiter": "?", "generator_delimiter": ";",)"
        R"( "ignore_fields": ["password", "`meta.data`.internal"]})");

    ASSERT_EQ(opts.expression, std::string("user::?id?"));
    ASSERT_EQ(opts.delimiters.field, '?');
    ASSERT_EQ(opts.delimiters.generator, ';');
    ASSERT_EQ(opts.ignore_fields.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(opts.ignore_fields[1], std::string("`meta.data`.internal"));
}

void test_options_defaults()
{
    KeyerOptions opts = KeyerOptions::from_json(R"({"key": "#MONO_INCR#"})");

    ASSERT_EQ(opts.delimiters.field, '%');
    ASSERT_EQ(opts.delimiters.generator, '#');
    ASSERT_TRUE(opts.ignore_fields.empty());
}

void test_options_errors()
{
    ASSERT_THROWS_MSG(KeyerOptions::from_json("[]"), ConfigError, "invalid configuration JSON");
    ASSERT_THROWS_MSG(KeyerOptions::from_json("{oops"), ConfigError, "invalid configuration JSON");
    ASSERT_THROWS_MSG(KeyerOptions::from_json(R"({"key": 5})"), ConfigError, "missing 'key'");
    ASSERT_THROWS_MSG(KeyerOptions::from_json(R"({"key": "k", "field_delimiter": "%%"})"),
                      ConfigError, "'field_delimiter' must be a single character string");
    ASSERT_THROWS_MSG(KeyerOptions::from_json(R"({"key": "k", "generator_delimiter": 1})"),
                      ConfigError, "'generator_delimiter' must be a single character string");
    ASSERT_THROWS_MSG(KeyerOptions::from_json(R"({"key": "k", "ignore_fields": "a"})"),
                      ConfigError, "'ignore_fields' must be an array of strings");
    ASSERT_THROWS_MSG(KeyerOptions::from_json(R"({"key": "k", "ignore_fields": ["a", 2]})"),
                      ConfigError, "'ignore_fields' must be an array of strings");
}

void test_keyer_rejects_bad_options()
{
    KeyerOptions opts;
    opts.expression = "%unclosed";
    ASSERT_THROWS(DocumentKeyer keyer(opts), ExpressionError);

    opts.expression = "%id%";
    opts.ignore_fields = {"a..b"};
    ASSERT_THROWS(DocumentKeyer keyer(opts), FieldPathError);

    opts.ignore_fields.clear();
    opts.delimiters.generator = '%';
    ASSERT_THROWS(DocumentKeyer keyer(opts), DelimiterError);
}

void test_keyer_keys_and_strips_fields()
{
    KeyerOptions opts;
    opts.expression = "user::%id%::#MONO_INCR#";
    opts.ignore_fields = {"id", "meta.secret", "missing.path"};

    DocumentKeyer keyer(opts);

    auto first = keyer.process(R"({"id": "alice", "meta": {"secret": "x", "age": 30}})");
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->key, std::string("user::alice::1"));
    ASSERT_EQ(first->body, std::string(R"({"meta":{"age":30}})"));

    auto second = keyer.process(R"({"id": 7})");
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second->key, std::string("user::7::2"));
    ASSERT_EQ(second->body, std::string("{}"));

    ASSERT_EQ(keyer.processed(), static_cast<std::size_t>(2));
    ASSERT_EQ(keyer.skipped(), static_cast<std::size_t>(0));
}

void test_keyer_body_untouched_without_ignored_fields()
{
    KeyerOptions opts;
    opts.expression = "%id%";
    DocumentKeyer keyer(opts);

    const std::string doc = R"({ "id" : "bob",  "x": [1, 2] })";
    auto keyed = keyer.process(doc);
    ASSERT_TRUE(keyed.has_value());
    ASSERT_EQ(keyed->body, doc);
}

/**
 * @brief Bad documents are skipped and counted; the batch keeps going.
 */
void test_keyer_skips_bad_documents()
{
    QuietLogs quiet;

    KeyerOptions opts;
    opts.expression = "%id%";
    opts.ignore_fields = {"tmp"};
    DocumentKeyer keyer(opts);

    const std::vector<std::string> batch = {
        R"({"id": "a", "tmp": 1})",
        R"({"id": null})",
        R"({"other": 1})",
        R"({"id": "b"})",
        R"({"id": ""})",
    };

    std::vector<std::string> keys;
    for (const auto& doc : batch) {
        if (auto keyed = keyer.process(doc)) {
            keys.push_back(keyed->key);
        }
    }

    ASSERT_EQ(keys.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(keys[0], std::string("a"));
    ASSERT_EQ(keys[1], std::string("b"));
    ASSERT_EQ(keyer.processed(), static_cast<std::size_t>(2));
    ASSERT_EQ(keyer.skipped(), static_cast<std::size_t>(3));
}

void test_keyer_non_object_document()
{
    QuietLogs quiet;

    KeyerOptions opts;
    opts.expression = "#MONO_INCR#";
    opts.ignore_fields = {"x"};
    DocumentKeyer keyer(opts);

    ASSERT_FALSE(keyer.process("[1, 2, 3]").has_value());
    ASSERT_EQ(keyer.skipped(), static_cast<std::size_t>(1));
}
