// test/integration/test_engine.cpp
// -----------------------------------------------------------
// AnonymizationEngine end to end against a scripted recognizer.

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "config/service_config.hpp"
#include "core/anonymization_engine.hpp"
#include "fake_recognizer.hpp"

namespace {

using namespace piiguard::core;
using piiguard::test::FakeRecognizer;

const std::string kContact = "Contact John Smith at 555-123-4567.";

std::vector<DetectedSpan> contactDetections() {
    return {makeSpan("PERSON", 8, 18, 0.9), makeSpan("PHONE_NUMBER", 22, 34, 0.85),
            // Overlaps the name with a lower score; must be resolved away.
            makeSpan("PERSON", 8, 12, 0.6)};
}

class EngineTest : public ::testing::Test {
  protected:
    EngineTest() : recognizer(contactDetections()) { config.encryptionKey = "0123456789abcdef"; }

    FakeRecognizer recognizer;
    piiguard::config::ServiceConfig config;
};

TEST_F(EngineTest, AnalyzeResolvesAndSummarizes) {
    AnonymizationEngine engine(recognizer, config);
    AnalysisOutcome outcome = engine.analyze(kContact, {});

    ASSERT_TRUE(outcome.success) << outcome.error;
    ASSERT_EQ(outcome.spans.size(), 2u);
    EXPECT_EQ(outcome.spans[0].entityType, "PERSON");
    EXPECT_EQ(outcome.spans[0].sourceText, "John Smith");
    EXPECT_EQ(outcome.spans[1].sourceText, "555-123-4567");
    EXPECT_EQ(outcome.statistics.totalEntities, 2u);
    EXPECT_EQ(outcome.language, "en");
    EXPECT_DOUBLE_EQ(outcome.scoreThreshold, 0.5);
    EXPECT_EQ(outcome.textLength, kContact.size());
    EXPECT_EQ(outcome.entitiesRequested, config.defaultEntities);
}

TEST_F(EngineTest, NoEntitiesIsStillASuccess) {
    FakeRecognizer quiet;
    AnonymizationEngine engine(quiet, config);
    AnalysisOutcome outcome = engine.analyze("Nothing sensitive here.", {});

    EXPECT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.spans.empty());
    EXPECT_EQ(outcome.statistics.totalEntities, 0u);
    EXPECT_DOUBLE_EQ(outcome.statistics.averageConfidence, 0.0);
}

TEST_F(EngineTest, RecognizerFailureIsDistinctFromEmpty) {
    recognizer.failMarker = "unreachable";
    AnonymizationEngine engine(recognizer, config);
    AnalysisOutcome outcome = engine.analyze("the analyzer is unreachable", {});

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Upstream);
    EXPECT_TRUE(outcome.spans.empty());
}

TEST_F(EngineTest, RejectsBlankTextAndBadThreshold) {
    AnonymizationEngine engine(recognizer, config);

    AnalysisOutcome blank = engine.analyze("   \n", {});
    EXPECT_FALSE(blank.success);
    EXPECT_EQ(blank.errorKind, ErrorKind::Validation);
    EXPECT_EQ(blank.error, "Text must be a non-empty string");

    AnalysisParams params;
    params.scoreThreshold = 1.5;
    EXPECT_EQ(engine.analyze(kContact, params).errorKind, ErrorKind::Validation);
    params.scoreThreshold = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(engine.analyze(kContact, params).errorKind, ErrorKind::Validation);
    EXPECT_EQ(recognizer.calls(), 0);
}

TEST_F(EngineTest, ThresholdAndEntityFilterApplyAfterDetection) {
    AnonymizationEngine engine(recognizer, config);
    AnalysisParams params;
    params.scoreThreshold = 0.88;
    params.entities = {"PERSON"};

    AnalysisOutcome outcome = engine.analyze(kContact, params);

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.spans.size(), 1u);
    EXPECT_EQ(outcome.spans[0].entityType, "PERSON");
}

TEST_F(EngineTest, ValidateEntitiesDropsUnknownAndFallsBack) {
    AnonymizationEngine engine(recognizer, config);

    std::vector<std::string> kept = engine.validateEntities({"PERSON", "MADE_UP", "PERSON", "EMAIL_ADDRESS"});
    EXPECT_EQ(kept, (std::vector<std::string>{"PERSON", "EMAIL_ADDRESS"}));
    EXPECT_EQ(engine.validateEntities({"MADE_UP"}), config.defaultEntities);
    EXPECT_EQ(engine.validateEntities({}), config.defaultEntities);
}

TEST_F(EngineTest, SupportedEntitiesFallsBackToDefaults) {
    recognizer.failCatalogue = true;
    AnonymizationEngine engine(recognizer, config);
    EXPECT_EQ(engine.supportedEntities(), config.defaultEntities);
}

TEST_F(EngineTest, AnonymizeWithDetectedSpans) {
    AnonymizationEngine engine(recognizer, config);
    AnonymizationRequest request;
    request.text = kContact;

    AnonymizationOutcome outcome = engine.anonymize(request);

    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(outcome.anonymizedText, "Contact [PERSON] at [PHONE].");
    EXPECT_EQ(outcome.items.size(), 2u);
    EXPECT_EQ(outcome.detected.size(), 2u);
    EXPECT_EQ(outcome.statistics.totalEntities, 2u);
}

TEST_F(EngineTest, AnonymizeWithCallerSpansSkipsRecognizer) {
    AnonymizationEngine engine(recognizer, config);
    AnonymizationRequest request;
    request.text = kContact;
    // Low score and an unlisted type are kept: caller spans are not filtered.
    request.spans = std::vector<DetectedSpan>{makeSpan("PERSON", 8, 18, 0.1), makeSpan("BADGE", 22, 34, 0.2)};
    PolicyTable policy;
    policy.set("BADGE", OperatorConfig::mask("*", 4, true));
    request.policy = policy;

    AnonymizationOutcome outcome = engine.anonymize(request);

    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(outcome.anonymizedText, "Contact [PERSON] at 555-123-****.");
    EXPECT_EQ(recognizer.calls(), 0);
}

TEST_F(EngineTest, MissingOperatorKeepsDetectionResults) {
    AnonymizationEngine engine(recognizer, config);
    AnonymizationRequest request;
    request.text = kContact;
    PolicyTable onlyPerson;
    onlyPerson.set("PERSON", OperatorConfig::redact());
    request.policy = onlyPerson;
    request.useDefaultPolicy = false;

    AnonymizationOutcome outcome = engine.anonymize(request);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Config);
    EXPECT_TRUE(outcome.analysisSucceeded);
    EXPECT_EQ(outcome.detected.size(), 2u);
    EXPECT_EQ(outcome.statistics.totalEntities, 2u);
    EXPECT_TRUE(outcome.anonymizedText.empty());
}

TEST_F(EngineTest, AnonymizeReportsAnalysisFailure) {
    recognizer.failMarker = "John";
    AnonymizationEngine engine(recognizer, config);
    AnonymizationRequest request;
    request.text = kContact;

    AnonymizationOutcome outcome = engine.anonymize(request);

    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.analysisSucceeded);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Upstream);
}

TEST_F(EngineTest, EncryptThenDeanonymize) {
    AnonymizationEngine engine(recognizer, config);
    AnonymizationRequest request;
    request.text = kContact;
    PolicyTable policy;
    policy.set("PERSON", OperatorConfig::encrypt());
    request.policy = policy;

    AnonymizationOutcome outcome = engine.anonymize(request);
    ASSERT_TRUE(outcome.success) << outcome.error;

    DeanonymizeOutcome restored = engine.deanonymize(outcome.anonymizedText, outcome.items);
    ASSERT_TRUE(restored.success) << restored.error;
    EXPECT_EQ(restored.text, "Contact John Smith at [PHONE].");

    DeanonymizeOutcome badKey = engine.deanonymize(outcome.anonymizedText, outcome.items, std::string(15, 'z'));
    EXPECT_FALSE(badKey.success);
}

TEST_F(EngineTest, CustomOperatorRegisteredOnEngine) {
    AnonymizationEngine engine(recognizer, config);
    engine.registry().registerCustom("tag", [](const std::string&, const DetectedSpan& span) {
        return "<" + span.entityType + ">";
    });
    AnonymizationRequest request;
    request.text = kContact;
    PolicyTable policy;
    policy.set("PHONE_NUMBER", OperatorConfig::customNamed("tag"));
    request.policy = policy;

    AnonymizationOutcome outcome = engine.anonymize(request);

    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(outcome.anonymizedText, "Contact [PERSON] at <PHONE_NUMBER>.");
}

TEST_F(EngineTest, BatchIsolatesFailingItems) {
    recognizer.failMarker = "boom";
    AnonymizationEngine engine(recognizer, config);
    std::vector<BatchItem> items = {BatchItem::fromText(kContact), BatchItem::fromText("boom goes the analyzer"),
                                    BatchItem::invalid("Text must be a string"), BatchItem::fromText(kContact)};

    BatchResult result = engine.batchAnalyze(items, {});

    ASSERT_TRUE(result.success) << result.error;
    ASSERT_EQ(result.run.results.size(), 4u);
    EXPECT_EQ(result.run.summary.succeeded, 2u);
    EXPECT_EQ(result.run.summary.failed, 2u);
    EXPECT_EQ(result.run.summary.totalEntities, 4u);
    EXPECT_TRUE(result.run.results[0].success);
    EXPECT_FALSE(result.run.results[1].success);
    EXPECT_EQ(result.run.results[2].error, "Text must be a string");
    EXPECT_EQ(result.run.results[3].spans.size(), 2u);
}

TEST_F(EngineTest, BatchRejectsEmptyListAndBadParameters) {
    AnonymizationEngine engine(recognizer, config);

    BatchResult empty = engine.batchAnalyze({}, {});
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.errorKind, ErrorKind::Validation);
    EXPECT_EQ(empty.error, "Texts must be a non-empty list");

    AnalysisParams params;
    params.scoreThreshold = -0.1;
    BatchResult badThreshold = engine.batchAnalyze({BatchItem::fromText("x")}, params);
    EXPECT_FALSE(badThreshold.success);
    EXPECT_EQ(badThreshold.errorKind, ErrorKind::Validation);
}

} // namespace
