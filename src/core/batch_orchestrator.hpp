#ifndef PIIGUARD_CORE_BATCH_ORCHESTRATOR_HPP
#define PIIGUARD_CORE_BATCH_ORCHESTRATOR_HPP

#include <string>
#include <vector>
#include <functional>
#include <algorithm>
#include <stdexcept>
#include "detected_span.hpp"
#include "statistics.hpp"
#include "errors.hpp"
#include "../util/thread_pool.hpp"
#include "../util/utf8.hpp"
#include "../util/logger.hpp"
#include "../../config/entity_defaults.hpp"

/**
 * @file batch_orchestrator.hpp
 * @brief Runs the analysis pipeline over many independent items.
 *
 * DESIGN:
 *   - Every item is processed on its own; an invalid entry or a pipeline failure becomes
 *     that item's error record and the remaining items carry on.
 *   - Items run on a ThreadPool of a caller-chosen size. Results are stored by index,
 *     so the output order always equals the input order.
 *   - The summary counts items, entities, successes and failures.
 *
 * USAGE:
 *   @code
 *   BatchOrchestrator orchestrator(4);
 *   BatchRun run = orchestrator.run(items, [&](const std::string &text) {
 *       return pipeline(text);   // returns BatchPipelineOutput or throws
 *   });
 *   @endcode
 */

namespace piiguard {
namespace core {

/**
 * @struct BatchItem
 * @brief One batch input: a text, or an entry already known to be unusable.
 */
struct BatchItem
{
    bool valid = false;
    std::string text;
    std::string invalidReason;

    static BatchItem fromText(const std::string &text)
    {
        BatchItem item;
        item.valid = true;
        item.text = text;
        return item;
    }

    static BatchItem invalid(const std::string &reason)
    {
        BatchItem item;
        item.invalidReason = reason;
        return item;
    }
};

/// What the per-item pipeline hands back on success.
struct BatchPipelineOutput
{
    ResolvedSpanSet spans;
    AnalysisStatistics statistics;
};

struct BatchItemResult
{
    size_t index = 0;
    bool success = false;
    std::string error;
    std::string textPreview;
    ResolvedSpanSet spans;
    AnalysisStatistics statistics;
};

struct BatchSummary
{
    size_t totalItems = 0;
    size_t totalEntities = 0;
    size_t succeeded = 0;
    size_t failed = 0;
};

struct BatchRun
{
    std::vector<BatchItemResult> results;
    BatchSummary summary;
};

using BatchPipeline = std::function<BatchPipelineOutput(const std::string &)>;

/**
 * @brief First kBatchPreviewLength code points of @p text, with "..." when cut.
 */
inline std::string makePreview(const std::string &text)
{
    std::string preview = util::utf8::prefix(text, config::kBatchPreviewLength);
    if (preview.size() < text.size()) {
        preview += "...";
    }
    return preview;
}

class BatchOrchestrator
{
public:
    explicit BatchOrchestrator(size_t concurrency)
        : concurrency_(concurrency == 0 ? 1 : concurrency)
    {
    }

    size_t concurrency() const { return concurrency_; }

    /**
     * @brief Process every item with @p pipeline and summarize.
     */
    BatchRun run(const std::vector<BatchItem> &items, const BatchPipeline &pipeline) const
    {
        BatchRun batch;
        if (items.empty()) {
            return batch;
        }

        util::ThreadPool pool(std::min(concurrency_, items.size()));
        batch.results = util::runIndexed(pool, items.size(), [&items, &pipeline](size_t index) {
            return processItem(index, items[index], pipeline);
        });

        batch.summary.totalItems = items.size();
        for (const auto &result : batch.results) {
            if (result.success) {
                ++batch.summary.succeeded;
                batch.summary.totalEntities += result.spans.size();
            } else {
                ++batch.summary.failed;
            }
        }

        util::logger::info("BatchOrchestrator: processed " + std::to_string(batch.summary.totalItems)
                           + " items, " + std::to_string(batch.summary.succeeded) + " succeeded, "
                           + std::to_string(batch.summary.failed) + " failed, "
                           + std::to_string(batch.summary.totalEntities) + " entities");
        return batch;
    }

private:
    // Never throws: every failure is folded into the returned record.
    static BatchItemResult processItem(size_t index, const BatchItem &item, const BatchPipeline &pipeline)
    {
        BatchItemResult result;
        result.index = index;

        if (!item.valid) {
            result.error = item.invalidReason.empty() ? "Invalid batch entry" : item.invalidReason;
            util::logger::warn("BatchOrchestrator: item " + std::to_string(index) + " rejected: " + result.error);
            return result;
        }

        try {
            BatchPipelineOutput output = pipeline(item.text);
            result.spans = std::move(output.spans);
            result.statistics = std::move(output.statistics);
            result.textPreview = makePreview(item.text);
            result.success = true;
        } catch (const std::exception &ex) {
            result.error = ex.what();
            util::logger::warn("BatchOrchestrator: item " + std::to_string(index) + " failed: " + result.error);
        }
        return result;
    }

    size_t concurrency_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_BATCH_ORCHESTRATOR_HPP
