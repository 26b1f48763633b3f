#ifndef PIIGUARD_CORE_ANONYMIZATION_ENGINE_HPP
#define PIIGUARD_CORE_ANONYMIZATION_ENGINE_HPP

#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cmath>
#include <cctype>
#include <unordered_set>
#include "detected_span.hpp"
#include "span_resolver.hpp"
#include "operator_registry.hpp"
#include "text_transformer.hpp"
#include "statistics.hpp"
#include "batch_orchestrator.hpp"
#include "errors.hpp"
#include "../recognizers/recognizer.hpp"
#include "../util/utf8.hpp"
#include "../util/logger.hpp"
#include "../../config/service_config.hpp"

/**
 * @file anonymization_engine.hpp
 * @brief The facade the service layer talks to.
 *
 * DESIGN:
 *   - Constructed once by the hosting process with a Recognizer and a ServiceConfig; it
 *     owns no other mutable state, so one instance serves concurrent requests.
 *   - Each operation validates its input, runs recognizer -> SpanResolver ->
 *     TextTransformer -> summarize, and returns an outcome struct. Exceptions raised by
 *     the components are caught here and reported through success/error/errorKind, so
 *     "nothing found" (success, empty spans) and "analysis failed" are never confused.
 *   - A ConfigError during anonymize only fails the rewrite; the detected spans and
 *     statistics are still returned.
 *
 * USAGE:
 *   @code
 *   recognizers::PatternRecognizer recognizer;
 *   config::ServiceConfig cfg;
 *   AnonymizationEngine engine(recognizer, cfg);
 *   AnonymizationRequest req;
 *   req.text = "Mail jane@example.org";
 *   AnonymizationOutcome out = engine.anonymize(req);
 *   // out.anonymizedText == "Mail [EMAIL]"
 *   @endcode
 */

namespace piiguard {
namespace core {

enum class ErrorKind
{
    None,
    Validation,
    Config,
    Upstream,
    Internal
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:       return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Config:     return "config";
        case ErrorKind::Upstream:   return "upstream";
        case ErrorKind::Internal:   return "internal";
    }
    return "internal";
}

/// Optional analysis parameters; unset fields take the service defaults.
struct AnalysisParams
{
    std::vector<std::string> entities;
    std::string language;
    std::optional<double> scoreThreshold;
};

struct AnalysisOutcome
{
    bool success = false;
    std::string error;
    ErrorKind errorKind = ErrorKind::None;

    ResolvedSpanSet spans;
    AnalysisStatistics statistics;

    std::vector<std::string> entitiesRequested;
    std::string language;
    double scoreThreshold = 0.0;
    size_t textLength = 0;  ///< code points
};

struct AnonymizationRequest
{
    std::string text;
    /// Spans computed by the caller; when absent the recognizer is run.
    std::optional<std::vector<DetectedSpan>> spans;
    /// Caller policy entries; merged over the defaults unless useDefaultPolicy is false.
    std::optional<PolicyTable> policy;
    bool useDefaultPolicy = true;
    AnalysisParams params;
};

struct AnonymizationOutcome
{
    bool success = false;
    std::string error;
    ErrorKind errorKind = ErrorKind::None;

    std::string anonymizedText;
    std::vector<AnonymizationItem> items;

    bool analysisSucceeded = false;
    ResolvedSpanSet detected;
    AnalysisStatistics statistics;
};

struct BatchResult
{
    bool success = false;
    std::string error;
    ErrorKind errorKind = ErrorKind::None;

    BatchRun run;
    std::vector<std::string> entitiesRequested;
    std::string language;
    double scoreThreshold = 0.0;
};

struct DeanonymizeOutcome
{
    bool success = false;
    std::string error;
    ErrorKind errorKind = ErrorKind::None;
    std::string text;
};

class AnonymizationEngine
{
public:
    AnonymizationEngine(const recognizers::Recognizer &recognizer, const config::ServiceConfig &config)
        : recognizer_(recognizer)
        , config_(config)
        , registry_(config.encryptionKey)
        , transformer_(registry_)
        , orchestrator_(config.batchConcurrency)
    {
        util::logger::info("AnonymizationEngine: using recognizer " + recognizer_.name()
                           + ", default threshold " + std::to_string(config_.confidenceThreshold));
    }

    AnonymizationEngine(const AnonymizationEngine &) = delete;
    AnonymizationEngine &operator=(const AnonymizationEngine &) = delete;

    const config::ServiceConfig &config() const { return config_; }

    /// Custom operators are registered here before the engine starts serving.
    OperatorRegistry &registry() { return registry_; }
    const OperatorRegistry &registry() const { return registry_; }

    /**
     * @brief Detect and resolve the PII spans of @p text.
     */
    AnalysisOutcome analyze(const std::string &text, const AnalysisParams &params) const
    {
        AnalysisOutcome outcome;
        try {
            requireText(text);
            const Settings settings = settingsFor(params);
            outcome.entitiesRequested = settings.entities;
            outcome.language = settings.language;
            outcome.scoreThreshold = settings.threshold;
            outcome.textLength = util::utf8::length(text);

            outcome.spans = detectResolved(text, settings);
            outcome.statistics = summarize(outcome.spans);
            outcome.success = true;
        } catch (const std::exception &ex) {
            fail(outcome, ex);
        }
        return outcome;
    }

    /**
     * @brief Rewrite the PII of a text under the request's policy.
     *
     * Caller-supplied spans are taken at face value: they are validated and de-overlapped
     * but not filtered by score or entity type.
     */
    AnonymizationOutcome anonymize(const AnonymizationRequest &request) const
    {
        AnonymizationOutcome outcome;
        try {
            requireText(request.text);
            if (request.spans) {
                outcome.detected = resolver_.resolve(util::utf8::length(request.text), *request.spans, 0.0);
                attachSourceText(request.text, outcome.detected);
            } else {
                outcome.detected = detectResolved(request.text, settingsFor(request.params));
            }
            outcome.statistics = summarize(outcome.detected);
            outcome.analysisSucceeded = true;
        } catch (const std::exception &ex) {
            fail(outcome, ex);
            return outcome;
        }

        try {
            const PolicyTable policy =
                registry_.effectivePolicy(request.policy ? &*request.policy : nullptr, request.useDefaultPolicy);
            TransformResult transformed = transformer_.transform(request.text, outcome.detected, policy);
            outcome.anonymizedText = std::move(transformed.text);
            outcome.items = std::move(transformed.items);
            outcome.success = true;
            util::logger::info("AnonymizationEngine: anonymized " + std::to_string(outcome.items.size())
                               + " entities");
        } catch (const std::exception &ex) {
            fail(outcome, ex);
        }
        return outcome;
    }

    /**
     * @brief Analyze every item independently. One bad item never fails the batch;
     * only unusable shared parameters do.
     */
    BatchResult batchAnalyze(const std::vector<BatchItem> &items, const AnalysisParams &params) const
    {
        BatchResult result;
        try {
            if (items.empty()) {
                throw ValidationError("Texts must be a non-empty list");
            }
            const Settings settings = settingsFor(params);
            result.entitiesRequested = settings.entities;
            result.language = settings.language;
            result.scoreThreshold = settings.threshold;

            result.run = orchestrator_.run(items, [this, &settings](const std::string &text) {
                BatchPipelineOutput output;
                output.spans = detectResolved(text, settings);
                output.statistics = summarize(output.spans);
                return output;
            });
            result.success = true;
        } catch (const std::exception &ex) {
            fail(result, ex);
        }
        return result;
    }

    /**
     * @brief Restore the encrypted spans of an anonymized text.
     * @param key AES key; empty uses the service key.
     */
    DeanonymizeOutcome deanonymize(const std::string &anonymizedText,
                                   const std::vector<AnonymizationItem> &items,
                                   const std::string &key = std::string()) const
    {
        DeanonymizeOutcome outcome;
        try {
            outcome.text = transformer_.deanonymize(anonymizedText, items, key);
            outcome.success = true;
        } catch (const std::exception &ex) {
            fail(outcome, ex);
        }
        return outcome;
    }

    /**
     * @brief Entity types the recognizer reports for @p language; the configured
     * defaults when the recognizer cannot be asked.
     */
    std::vector<std::string> supportedEntities(const std::string &language = std::string()) const
    {
        const std::string lang = language.empty() ? config_.defaultLanguage : language;
        try {
            return recognizer_.supportedEntityTypes(lang);
        } catch (const std::exception &ex) {
            util::logger::warn("AnonymizationEngine: cannot list supported entities for '" + lang
                               + "': " + ex.what());
            return config_.defaultEntities;
        }
    }

    /**
     * @brief Keep the requested types the recognizer supports. Unknown types are dropped
     * with a warning; an empty request or an empty result yields the default entity set.
     */
    std::vector<std::string> validateEntities(const std::vector<std::string> &requested,
                                              const std::string &language = std::string()) const
    {
        if (requested.empty()) {
            return config_.defaultEntities;
        }
        const std::vector<std::string> supported = supportedEntities(language);
        const std::unordered_set<std::string> known(supported.begin(), supported.end());

        std::vector<std::string> valid;
        for (const auto &type : requested) {
            if (known.count(type) == 0) {
                util::logger::warn("AnonymizationEngine: unsupported entity type '" + type + "' ignored");
                continue;
            }
            if (std::find(valid.begin(), valid.end(), type) == valid.end()) {
                valid.push_back(type);
            }
        }
        if (valid.empty()) {
            util::logger::warn("AnonymizationEngine: no requested entity type is supported, using defaults");
            return config_.defaultEntities;
        }
        return valid;
    }

private:
    struct Settings
    {
        std::vector<std::string> entities;
        std::string language;
        double threshold = 0.0;
    };

    Settings settingsFor(const AnalysisParams &params) const
    {
        Settings settings;
        settings.language = params.language.empty() ? config_.defaultLanguage : params.language;
        settings.threshold = params.scoreThreshold ? *params.scoreThreshold : config_.confidenceThreshold;
        if (std::isnan(settings.threshold) || settings.threshold < 0.0 || settings.threshold > 1.0) {
            throw ValidationError("score_threshold must be between 0 and 1");
        }
        settings.entities = validateEntities(params.entities, settings.language);
        return settings;
    }

    static void requireText(const std::string &text)
    {
        const bool blank = std::all_of(text.begin(), text.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        });
        if (blank) {
            throw ValidationError("Text must be a non-empty string");
        }
    }

    // Recognizer output re-validated and de-overlapped; throws UpstreamError when detection fails.
    ResolvedSpanSet detectResolved(const std::string &text, const Settings &settings) const
    {
        std::vector<DetectedSpan> raw;
        try {
            raw = recognizer_.detect(text, settings.entities, settings.language, settings.threshold);
        } catch (const UpstreamError &) {
            throw;
        } catch (const std::exception &ex) {
            throw UpstreamError(std::string("Analysis failed: ") + ex.what());
        }

        ResolvedSpanSet spans = resolver_.resolve(util::utf8::length(text), raw, settings.threshold,
                                                  settings.entities);
        attachSourceText(text, spans);
        util::logger::info("AnonymizationEngine: Found " + std::to_string(spans.size()) + " PII entities");
        return spans;
    }

    template <typename Outcome>
    static void fail(Outcome &outcome, const std::exception &ex)
    {
        outcome.success = false;
        outcome.error = ex.what();
        if (dynamic_cast<const ValidationError *>(&ex)) {
            outcome.errorKind = ErrorKind::Validation;
        } else if (dynamic_cast<const ConfigError *>(&ex)) {
            outcome.errorKind = ErrorKind::Config;
        } else if (dynamic_cast<const UpstreamError *>(&ex)) {
            outcome.errorKind = ErrorKind::Upstream;
        } else {
            outcome.errorKind = ErrorKind::Internal;
        }
        util::logger::warn(std::string("AnonymizationEngine: ") + errorKindName(outcome.errorKind)
                           + " error: " + outcome.error);
    }

    const recognizers::Recognizer &recognizer_;
    const config::ServiceConfig &config_;
    OperatorRegistry registry_;
    SpanResolver resolver_;
    TextTransformer transformer_;
    BatchOrchestrator orchestrator_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_ANONYMIZATION_ENGINE_HPP
