#pragma once

#include "core/Config.hpp"
#include "core/ItemStore.hpp"
#include "embedding/Vectorizer.hpp"
#include "pipeline/RetryPolicy.hpp"
#include "providers/Providers.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio/thread_pool.hpp>

namespace later {

struct PipelineOptions {
    VectorizerConfig vectorizer;
    int maxInputTokens = 8000;
    int embeddingBatchSize = 16;
    RetryConfig retry;
    int workerThreads = 4;
    RetryPolicy::Sleeper sleeper;   // tests replace the backoff sleep
};

// extract -> summarise -> embed -> classify for one URL. Every stage persists its
// output, so a failed item resumes at its first incomplete stage.
class IngestionPipeline {
public:
    IngestionPipeline(ItemStore& store,
                      ContentExtractor& extractor,
                      CompletionProvider& completion,
                      EmbeddingProvider& embedder,
                      const PipelineOptions& options = {});
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;

    // Validates and canonicalizes the URL and creates the row.
    // Throws ValidationError for a bad URL and ConflictError for a duplicate.
    Item submit(const std::string& userId, const std::string& rawUrl);

    // Runs the remaining stages. A stage failure is recorded on the item, which is
    // returned in the error state. Returns nullopt if the item was deleted meanwhile.
    // Throws ConflictError (after removing the new row) when extraction reveals a
    // canonical URL that another item already has.
    std::optional<Item> run(const std::string& userId, const std::string& itemId,
                            const CancelToken* cancel = nullptr);

    // submit() + run()
    std::optional<Item> ingest(const std::string& userId, const std::string& rawUrl);

    // submit() now, run() on the worker pool
    Item submitAsync(const std::string& userId, const std::string& rawUrl);

    // Re-enters a stored item at its first incomplete stage on the worker pool.
    // Throws NotFoundError for an unknown item.
    void retryAsync(const std::string& userId, const std::string& itemId);

    // Aborts a background run of the item, if any. True when one was running.
    bool cancel(const std::string& itemId);

    // Blocks until every queued background run has finished
    void drain();

private:
    ItemStore& store_;
    ContentExtractor& extractor_;
    CompletionProvider& completion_;
    EmbeddingProvider& embedder_;
    PipelineOptions options_;
    Vectorizer vectorizer_;
    RetryPolicy retry_;

    std::mutex mutex_;
    std::condition_variable idle_;
    std::map<std::string, CancelTokenPtr> running_;
    boost::asio::thread_pool pool_;

    // Each stage returns false when the item has disappeared
    bool extractStage(Item& item, const CancelToken* cancel);
    bool summariseStage(Item& item, const CancelToken* cancel);
    bool embedStage(Item& item, const CancelToken* cancel);
    bool classifyStage(Item& item);

    void recordFailure(const Item& item, const std::string& message);
    void schedule(const std::string& userId, const std::string& itemId);

    static std::string buildSummaryContext(const Item& item);
};

} // namespace later
