// test/unit/test_text_transformer.cpp
// -----------------------------------------------------------
// TextTransformer: splice, audit items and deanonymize.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/operator_registry.hpp"
#include "core/span_resolver.hpp"
#include "core/text_transformer.hpp"
#include "util/utf8.hpp"

namespace {

using namespace piiguard::core;

const std::string kContact = "Contact John Smith at 555-123-4567.";

ResolvedSpanSet contactSpans() {
    return {makeSpan("PERSON", 8, 18, 0.9), makeSpan("PHONE_NUMBER", 22, 34, 0.85)};
}

// Substitute originals back into the anonymized text using the recorded offsets.
std::string restore(const TransformResult& result) {
    std::string out;
    int64_t cursor = 0;
    for (const auto& item : result.items) {
        out += piiguard::util::utf8::substr(result.text, static_cast<size_t>(cursor),
                                            static_cast<size_t>(item.anonymizedStart));
        out += item.originalText;
        cursor = item.anonymizedEnd;
    }
    out += piiguard::util::utf8::substr(result.text, static_cast<size_t>(cursor),
                                        piiguard::util::utf8::length(result.text));
    return out;
}

TEST(TextTransformerTest, DefaultPolicyReplacesContactDetails) {
    OperatorRegistry registry;
    TextTransformer transformer(registry);

    TransformResult result = transformer.transform(kContact, contactSpans(), registry.defaults());

    EXPECT_EQ(result.text, "Contact [PERSON] at [PHONE].");
    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.items[0].entityType, "PERSON");
    EXPECT_EQ(result.items[0].originalStart, 8);
    EXPECT_EQ(result.items[0].originalEnd, 18);
    EXPECT_EQ(result.items[0].originalText, "John Smith");
    EXPECT_EQ(result.items[0].replacementText, "[PERSON]");
    EXPECT_EQ(result.items[0].strategy, "replace");
    EXPECT_EQ(result.items[0].anonymizedStart, 8);
    EXPECT_EQ(result.items[0].anonymizedEnd, 16);
    EXPECT_EQ(result.items[1].originalText, "555-123-4567");
    EXPECT_EQ(result.items[1].anonymizedStart, 20);
    EXPECT_EQ(result.items[1].anonymizedEnd, 27);
}

TEST(TextTransformerTest, SpliceRestoresOriginal) {
    OperatorRegistry registry;
    TextTransformer transformer(registry);

    PolicyTable policy;
    policy.set("PERSON", OperatorConfig::mask("#", 3, true));
    policy.set("PHONE_NUMBER", OperatorConfig::redact());
    policy.setWildcard(OperatorConfig::hash());

    const std::string text = "Ärztin Zoë Müller, Tel 030-1234, ID X7";
    const std::vector<size_t> bounds = piiguard::util::utf8::boundaries(text);
    const int64_t len = static_cast<int64_t>(bounds.size() - 1);
    ResolvedSpanSet spans = {makeSpan("PERSON", 7, 17, 0.9), makeSpan("PHONE_NUMBER", 23, 31, 0.8),
                             makeSpan("ID", len - 2, len, 0.7)};

    TransformResult result = transformer.transform(text, spans, policy);

    EXPECT_EQ(result.items.size(), 3u);
    EXPECT_EQ(result.items[0].originalText, "Zoë Müller");
    EXPECT_EQ(result.items[0].replacementText, "Zoë Mül###");
    EXPECT_EQ(result.items[1].replacementText, "");
    EXPECT_EQ(restore(result), text);
}

TEST(TextTransformerTest, EmptyCases) {
    OperatorRegistry registry;
    TextTransformer transformer(registry);

    TransformResult untouched = transformer.transform(kContact, {}, registry.defaults());
    EXPECT_EQ(untouched.text, kContact);
    EXPECT_TRUE(untouched.items.empty());

    TransformResult empty = transformer.transform("", contactSpans(), registry.defaults());
    EXPECT_EQ(empty.text, "");
    EXPECT_TRUE(empty.items.empty());
}

TEST(TextTransformerTest, RejectsUnresolvedSpans) {
    OperatorRegistry registry;
    TextTransformer transformer(registry);

    ResolvedSpanSet overlapping = {makeSpan("A", 0, 10, 0.9), makeSpan("B", 5, 12, 0.9)};
    EXPECT_THROW(transformer.transform(kContact, overlapping, registry.defaults()), ValidationError);

    ResolvedSpanSet outOfRange = {makeSpan("A", 30, 80, 0.9)};
    EXPECT_THROW(transformer.transform(kContact, outOfRange, registry.defaults()), ValidationError);
}

TEST(TextTransformerTest, MissingOperatorRaisesConfigError) {
    OperatorRegistry registry;
    TextTransformer transformer(registry);

    PolicyTable onlyPerson;
    onlyPerson.set("PERSON", OperatorConfig::redact());
    EXPECT_THROW(transformer.transform(kContact, contactSpans(), onlyPerson), ConfigError);
}

TEST(TextTransformerTest, EncryptThenDeanonymize) {
    const std::string key = "0123456789abcdef0123456789abcdef";
    OperatorRegistry registry(key);
    TextTransformer transformer(registry);

    PolicyTable policy = registry.defaults();
    policy.set("PERSON", OperatorConfig::encrypt());

    TransformResult result = transformer.transform(kContact, contactSpans(), policy);
    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.items[0].strategy, "encrypt");
    EXPECT_EQ(result.text.find("John"), std::string::npos);

    // The phone stays replaced; only the encrypted name comes back.
    EXPECT_EQ(transformer.deanonymize(result.text, result.items), "Contact John Smith at [PHONE].");
    EXPECT_EQ(transformer.deanonymize(result.text, result.items, key), "Contact John Smith at [PHONE].");
}

TEST(TextTransformerTest, DeanonymizeFailures) {
    const std::string key = "0123456789abcdef";
    OperatorRegistry registry(key);
    TextTransformer transformer(registry);

    AnonymizationItem item;
    item.entityType = "PERSON";
    item.strategy = "encrypt";
    item.anonymizedStart = 0;
    item.anonymizedEnd = 5;
    EXPECT_THROW(transformer.deanonymize("hello world", {item}), ValidationError);

    item.anonymizedEnd = 500;
    EXPECT_THROW(transformer.deanonymize("hello world", {item}), ValidationError);

    OperatorRegistry keyless;
    TextTransformer noKey(keyless);
    item.anonymizedEnd = 5;
    EXPECT_THROW(noKey.deanonymize("hello world", {item}), ConfigError);

    // Nothing encrypted: text comes back unchanged.
    AnonymizationItem replaced;
    replaced.strategy = "replace";
    EXPECT_EQ(transformer.deanonymize("[PERSON] here", {replaced}), "[PERSON] here");
}

} // namespace
