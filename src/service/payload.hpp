#ifndef PIIGUARD_SERVICE_PAYLOAD_HPP
#define PIIGUARD_SERVICE_PAYLOAD_HPP

#include <string>
#include <vector>
#include <cmath>
#include "../core/anonymization_engine.hpp"
#include "../core/errors.hpp"
#include "../util/json.hpp"
#include "../../config/entity_defaults.hpp"

/**
 * @file payload.hpp
 * @brief Conversions between API JSON bodies and engine types.
 *
 * Readers (JSON -> engine) throw core::ValidationError when a field has the wrong shape
 * and core::ConfigError when an anonymization_config entry names an unknown strategy.
 * Writers (engine -> JSON) never throw.
 */

namespace piiguard {
namespace service {

using util::json::Value;

/**
 * @brief Parse a request body that must be a JSON object.
 */
inline Value parseBody(const std::string &body)
{
    if (body.empty()) {
        throw core::ValidationError("No JSON data provided");
    }
    Value doc;
    try {
        doc = Value::parse(body);
    } catch (const util::json::ParseError &ex) {
        throw core::ValidationError(std::string("Invalid JSON: ") + ex.what());
    }
    if (!doc.isObject()) {
        throw core::ValidationError("No JSON data provided");
    }
    return doc;
}

/**
 * @brief The member @p key, which must be present and non-null.
 */
inline const Value &requireField(const Value &doc, const std::string &key)
{
    const Value *v = doc.find(key);
    if (v == nullptr || v->isNull()) {
        throw core::ValidationError("Missing required field: " + key);
    }
    return *v;
}

inline std::string readText(const Value &doc, const std::string &key = "text")
{
    const Value &v = requireField(doc, key);
    if (!v.isString()) {
        throw core::ValidationError("Text must be a non-empty string");
    }
    return v.asString();
}

inline std::vector<std::string> readStringList(const Value &v, const std::string &what)
{
    if (!v.isArray()) {
        throw core::ValidationError(what + " must be a list of strings");
    }
    std::vector<std::string> out;
    for (const auto &item : v.items()) {
        if (!item.isString()) {
            throw core::ValidationError(what + " must be a list of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

/**
 * @brief entities / language / score_threshold of an analysis request.
 */
inline core::AnalysisParams readAnalysisParams(const Value &doc)
{
    core::AnalysisParams params;
    if (const Value *entities = doc.find("entities")) {
        if (!entities->isNull()) {
            params.entities = readStringList(*entities, "entities");
        }
    }
    if (const Value *language = doc.find("language")) {
        if (!language->isNull()) {
            if (!language->isString()) {
                throw core::ValidationError("language must be a string");
            }
            params.language = language->asString();
        }
    }
    if (const Value *threshold = doc.find("score_threshold")) {
        if (!threshold->isNull()) {
            if (!threshold->isNumber()) {
                throw core::ValidationError("score_threshold must be a number");
            }
            params.scoreThreshold = threshold->asNumber();
        }
    }
    return params;
}

/// Largest integer a double holds exactly (2^53).
constexpr double kMaxOffset = 9007199254740992.0;

/**
 * @brief True for a whole number in [0, 2^53], the only values usable as a text offset.
 */
inline bool isOffset(double d)
{
    return std::isfinite(d) && d >= 0.0 && d <= kMaxOffset && std::floor(d) == d;
}

/**
 * @brief Caller-supplied spans ("analyzer_results").
 */
inline std::vector<core::DetectedSpan> readSpans(const Value &v)
{
    if (!v.isArray()) {
        throw core::ValidationError("analyzer_results must be a list");
    }
    std::vector<core::DetectedSpan> spans;
    for (const auto &item : v.items()) {
        const Value *type = item.find("entity_type");
        const Value *start = item.find("start");
        const Value *end = item.find("end");
        const Value *score = item.find("score");
        if (type == nullptr || !type->isString() || start == nullptr || !start->isNumber()
            || end == nullptr || !end->isNumber()) {
            throw core::ValidationError("analyzer_results entries need entity_type, start and end");
        }
        if (score != nullptr && !score->isNull() && !score->isNumber()) {
            throw core::ValidationError("analyzer_results score must be a number");
        }
        // Fractional or out-of-range offsets are malformed spans; the resolver drops them.
        const double s = start->asNumber();
        const double e = end->asNumber();
        const bool usable = isOffset(s) && isOffset(e);
        spans.push_back(core::makeSpan(type->asString(),
                                       usable ? static_cast<int64_t>(s) : -1,
                                       usable ? static_cast<int64_t>(e) : -1,
                                       (score != nullptr && score->isNumber()) ? score->asNumber() : 1.0));
    }
    return spans;
}

/**
 * @brief One anonymization_config entry, e.g.
 *        {"type":"mask","masking_char":"#","chars_to_mask":4,"from_end":true}.
 */
inline core::OperatorConfig readOperator(const std::string &entityType, const Value &v)
{
    if (!v.isObject()) {
        throw core::ValidationError("anonymization_config['" + entityType + "'] must be an object");
    }
    const Value *type = v.find("type");
    if (type == nullptr || !type->isString()) {
        throw core::ValidationError("anonymization_config['" + entityType + "'] needs a string 'type'");
    }

    core::OperatorConfig cfg;
    cfg.strategy = core::parseStrategy(type->asString());
    for (size_t i = 0; i < v.keys().size(); ++i) {
        const std::string &key = v.keys()[i];
        const Value &param = v.items()[i];
        if (key == "type") {
            continue;
        }
        if (param.isString()) {
            cfg.params[key] = param.asString();
        } else if (param.isBool()) {
            cfg.params[key] = param.asBool() ? "true" : "false";
        } else if (param.isNumber()) {
            cfg.params[key] = param.dump();
        } else if (!param.isNull()) {
            throw core::ValidationError("anonymization_config['" + entityType + "']." + key
                                        + " must be a string, number or boolean");
        }
    }
    return cfg;
}

inline core::PolicyTable readPolicy(const Value &v)
{
    if (!v.isObject()) {
        throw core::ValidationError("anonymization_config must be an object");
    }
    core::PolicyTable table;
    for (size_t i = 0; i < v.keys().size(); ++i) {
        table.set(v.keys()[i], readOperator(v.keys()[i], v.items()[i]));
    }
    return table;
}

/**
 * @brief The "texts" list of a batch request. Entries that are not strings become
 *        invalid items so the rest of the batch still runs.
 */
inline std::vector<core::BatchItem> readBatchItems(const Value &doc)
{
    const Value &texts = requireField(doc, "texts");
    if (!texts.isArray() || texts.size() == 0) {
        throw core::ValidationError("Texts must be a non-empty list");
    }
    std::vector<core::BatchItem> items;
    for (const auto &entry : texts.items()) {
        if (entry.isString()) {
            items.push_back(core::BatchItem::fromText(entry.asString()));
        } else {
            items.push_back(core::BatchItem::invalid("Text must be a string"));
        }
    }
    return items;
}

/**
 * @brief Audit items echoed back for deanonymize.
 */
inline std::vector<core::AnonymizationItem> readItems(const Value &v)
{
    if (!v.isArray()) {
        throw core::ValidationError("items must be a list");
    }
    std::vector<core::AnonymizationItem> items;
    for (const auto &entry : v.items()) {
        const Value *op = entry.find("operator");
        const Value *start = entry.find("start");
        const Value *end = entry.find("end");
        if (op == nullptr || !op->isString() || start == nullptr || !start->isNumber()
            || end == nullptr || !end->isNumber()) {
            throw core::ValidationError("items entries need operator, start and end");
        }
        if (!isOffset(start->asNumber()) || !isOffset(end->asNumber())) {
            throw core::ValidationError("items start and end must be non-negative integers");
        }
        core::AnonymizationItem item;
        item.strategy = op->asString();
        item.anonymizedStart = static_cast<int64_t>(start->asNumber());
        item.anonymizedEnd = static_cast<int64_t>(end->asNumber());
        if (const Value *type = entry.find("entity_type")) {
            if (type->isString()) {
                item.entityType = type->asString();
            }
        }
        items.push_back(std::move(item));
    }
    return items;
}

inline Value toJson(const core::DetectedSpan &span)
{
    Value v = Value::object();
    v.set("entity_type", span.entityType);
    v.set("start", static_cast<long long>(span.start));
    v.set("end", static_cast<long long>(span.end));
    v.set("score", span.score);
    v.set("text", span.sourceText);
    return v;
}

inline Value toJson(const core::ResolvedSpanSet &spans)
{
    Value arr = Value::array();
    for (const auto &span : spans) {
        arr.push_back(toJson(span));
    }
    return arr;
}

inline Value toJson(const core::AnalysisStatistics &stats)
{
    Value counts = Value::object();
    for (const auto &entry : stats.entityCounts) {
        counts.set(entry.first, entry.second);
    }
    Value buckets = Value::object();
    buckets.set("high", stats.buckets.high);
    buckets.set("medium", stats.buckets.medium);
    buckets.set("low", stats.buckets.low);

    Value v = Value::object();
    v.set("total_entities", stats.totalEntities);
    v.set("entity_counts", counts);
    v.set("average_confidence", stats.averageConfidence);
    v.set("confidence_distribution", buckets);
    return v;
}

/// start/end locate the replacement in the anonymized text.
inline Value toJson(const core::AnonymizationItem &item)
{
    Value v = Value::object();
    v.set("operator", item.strategy);
    v.set("entity_type", item.entityType);
    v.set("start", static_cast<long long>(item.anonymizedStart));
    v.set("end", static_cast<long long>(item.anonymizedEnd));
    v.set("text", item.replacementText);
    v.set("original_start", static_cast<long long>(item.originalStart));
    v.set("original_end", static_cast<long long>(item.originalEnd));
    v.set("original_text", item.originalText);
    return v;
}

inline Value toJson(const core::BatchItemResult &result)
{
    Value v = Value::object();
    v.set("index", result.index);
    if (result.success) {
        v.set("text_preview", result.textPreview);
        v.set("results", toJson(result.spans));
        v.set("statistics", toJson(result.statistics));
    } else {
        v.set("error", result.error);
        v.set("results", Value::array());
        v.set("statistics", Value::object());
    }
    return v;
}

inline Value toJson(const core::BatchSummary &summary)
{
    Value v = Value::object();
    v.set("total_texts", summary.totalItems);
    v.set("total_entities_found", summary.totalEntities);
    v.set("successful_analyses", summary.succeeded);
    v.set("failed_analyses", summary.failed);
    return v;
}

inline Value toJson(const core::OperatorConfig &cfg)
{
    Value v = Value::object();
    v.set("type", core::strategyName(cfg.strategy));
    for (const auto &param : cfg.params) {
        v.set(param.first, param.second);
    }
    return v;
}

inline Value toJson(const core::PolicyTable &table)
{
    Value v = Value::object();
    for (const auto &entry : table.entries()) {
        v.set(entry.first, toJson(entry.second));
    }
    return v;
}

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_PAYLOAD_HPP
