#include "pipeline/IngestionPipeline.hpp"
#include "core/Errors.hpp"
#include "core/UrlUtils.hpp"
#include "embedding/Tokenizer.hpp"
#include "providers/StructuredOutput.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <boost/asio/post.hpp>

namespace later {

namespace {
    const char* kSummaryPrompt =
        "Your role is to extract key metadata from the scraped data. "
        "Provide a 1-2 sentence summary and an expiry score between 0 and 1 "
        "where 1 decays fastest (breaking news) and 0 is evergreen.";

    // Summaries only need the opening of very long articles
    constexpr size_t kMaxContextChars = 32000;

    std::string truncateUtf8(const std::string& s, size_t limit) {
        if (s.size() <= limit) return s;
        size_t cut = limit;
        while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
        return s.substr(0, cut);
    }
}

IngestionPipeline::IngestionPipeline(ItemStore& store,
                                     ContentExtractor& extractor,
                                     CompletionProvider& completion,
                                     EmbeddingProvider& embedder,
                                     const PipelineOptions& options)
    : store_(store),
      extractor_(extractor),
      completion_(completion),
      embedder_(embedder),
      options_(options),
      vectorizer_(embedder, options.vectorizer, options.embeddingBatchSize),
      retry_(options.retry, options.sleeper),
      pool_(static_cast<std::size_t>(std::max(1, options.workerThreads))) {}

IngestionPipeline::~IngestionPipeline() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : running_) {
            entry.second->cancel();
        }
    }
    pool_.join();
}

std::string IngestionPipeline::buildSummaryContext(const Item& item) {
    std::ostringstream context;
    if (item.title) context << "Title: " << *item.title << "\n";
    if (item.sourceSite) context << "Source: " << *item.sourceSite << "\n";
    if (item.publicationDate) context << "Published: " << *item.publicationDate << "\n";
    context << "URL: " << item.canonicalUrl.value_or(item.url) << "\n";

    const std::string& body = item.contentMarkdown ? *item.contentMarkdown
                                                   : item.contentText.value_or("");
    if (!body.empty()) {
        context << "\nArticle Content:\n" << truncateUtf8(body, kMaxContextChars);
    }
    return context.str();
}

Item IngestionPipeline::submit(const std::string& userId, const std::string& rawUrl) {
    if (userId.empty()) {
        throw ValidationError("User id is required");
    }
    std::string url = prepareUrl(rawUrl);

    NewItem item;
    item.userId = userId;
    item.url = url;
    item.canonicalUrl = canonicalizeUrl(url);

    Item created = store_.createItem(item);
    std::cout << "[pipeline] saved " << created.id << " " << url << std::endl;
    return created;
}

bool IngestionPipeline::extractStage(Item& item, const CancelToken* cancel) {
    ArticleContent article = retry_.run("extract",
        [&]() { return extractor_.extract(item.url, cancel); }, cancel);

    ItemUpdate update;
    if (article.canonicalUrl) {
        std::string canonical = canonicalizeUrl(*article.canonicalUrl);
        if (!canonical.empty() && canonical != item.canonicalUrl.value_or("")) {
            update.canonicalUrl = canonical;
        }
    }
    update.title = article.title;
    update.sourceSite = article.sourceSite;
    update.publicationDate = article.publicationDate;
    update.faviconUrl = article.faviconUrl;
    update.contentMarkdown = article.markdown;
    update.contentText = article.text;
    update.tokenCount = Tokenizer::countTokens(article.text);
    update.serverStatus = ServerStatus::Extracted;

    try {
        if (!store_.updateItem(item.userId, item.id, update)) {
            return false;
        }
    } catch (const ConflictError&) {
        store_.deleteItem(item.userId, item.id);
        throw ConflictError("Item already saved: " + update.canonicalUrl.value_or(item.url));
    }

    if (update.canonicalUrl) item.canonicalUrl = update.canonicalUrl;
    item.title = article.title;
    item.sourceSite = article.sourceSite;
    item.publicationDate = article.publicationDate;
    item.faviconUrl = article.faviconUrl;
    item.contentMarkdown = article.markdown;
    item.contentText = article.text;
    item.tokenCount = update.tokenCount;
    item.serverStatus = ServerStatus::Extracted;
    return true;
}

bool IngestionPipeline::summariseStage(Item& item, const CancelToken* cancel) {
    const std::string context = buildSummaryContext(item);
    nlohmann::json output = retry_.run("summarise",
        [&]() {
            return completion_.complete(kSummaryPrompt, context, StructuredOutput::summarySchema(),
                                        cancel);
        }, cancel);
    SummaryOutput summary = StructuredOutput::parseSummary(output);

    ItemUpdate update;
    update.summary = summary.summary;
    update.expiryScore = summary.expiryScore;
    update.serverStatus = ServerStatus::Summarised;
    if (!store_.updateItem(item.userId, item.id, update)) {
        return false;
    }
    item.summary = summary.summary;
    item.expiryScore = summary.expiryScore;
    item.serverStatus = ServerStatus::Summarised;
    return true;
}

bool IngestionPipeline::embedStage(Item& item, const CancelToken* cancel) {
    const std::string text = item.contentText.value_or("");
    VectorizedText vectors = retry_.run("embed",
        [&]() { return vectorizer_.vectorize(text, options_.maxInputTokens, cancel); }, cancel);

    ItemUpdate update;
    update.serverStatus = ServerStatus::Embedded;
    update.tokenCount = vectors.tokenCount;
    if (!store_.storeEmbeddings(item.userId, item.id, vectors.fullEmbedding, vectors.chunks, update)) {
        return false;
    }
    item.embedding = std::move(vectors.fullEmbedding);
    item.tokenCount = vectors.tokenCount;
    item.serverStatus = ServerStatus::Embedded;
    return true;
}

bool IngestionPipeline::classifyStage(Item& item) {
    ItemUpdate update;
    update.serverStatus = ServerStatus::Classified;
    update.clientStatus = ClientStatus::Queued;
    update.clearError = true;
    if (!store_.updateItem(item.userId, item.id, update)) {
        return false;
    }
    item.serverStatus = ServerStatus::Classified;
    item.clientStatus = ClientStatus::Queued;
    item.errorMessage.reset();
    return true;
}

void IngestionPipeline::recordFailure(const Item& item, const std::string& message) {
    std::cerr << "[pipeline] " << item.id << " failed at " << to_string(item.serverStatus)
              << ": " << message << std::endl;
    ItemUpdate update;
    update.clientStatus = ClientStatus::Error;
    update.errorMessage = message;
    store_.updateItem(item.userId, item.id, update);
}

std::optional<Item> IngestionPipeline::run(const std::string& userId, const std::string& itemId,
                                           const CancelToken* cancel) {
    std::optional<Item> loaded = store_.getItem(userId, itemId);
    if (!loaded) {
        return std::nullopt;
    }
    Item item = std::move(*loaded);
    if (item.serverStatus == ServerStatus::Classified && item.clientStatus != ClientStatus::Error) {
        return item;
    }

    if (item.clientStatus == ClientStatus::Error) {
        ItemUpdate resume;
        resume.clientStatus = ClientStatus::Adding;
        resume.clearError = true;
        if (!store_.updateItem(userId, itemId, resume)) {
            return std::nullopt;
        }
        item.clientStatus = ClientStatus::Adding;
        item.errorMessage.reset();
    }

    try {
        if (item.serverStatus == ServerStatus::Saved && !extractStage(item, cancel)) {
            return std::nullopt;
        }
        if (item.serverStatus == ServerStatus::Extracted && !summariseStage(item, cancel)) {
            return std::nullopt;
        }
        if (item.serverStatus == ServerStatus::Summarised && !embedStage(item, cancel)) {
            return std::nullopt;
        }
        if (item.serverStatus == ServerStatus::Embedded && !classifyStage(item)) {
            return std::nullopt;
        }
    } catch (const ConflictError&) {
        throw;
    } catch (const Error& e) {
        if (cancel && cancel->cancelled()) {
            std::cout << "[pipeline] " << itemId << " cancelled" << std::endl;
            return std::nullopt;
        }
        recordFailure(item, e.what());
        return store_.getItem(userId, itemId);
    } catch (const std::exception& e) {
        recordFailure(item, std::string("Unexpected failure: ") + e.what());
        return store_.getItem(userId, itemId);
    }

    std::cout << "[pipeline] " << itemId << " ready" << std::endl;
    return store_.getItem(userId, itemId);
}

std::optional<Item> IngestionPipeline::ingest(const std::string& userId, const std::string& rawUrl) {
    Item item = submit(userId, rawUrl);
    return run(userId, item.id);
}

void IngestionPipeline::schedule(const std::string& userId, const std::string& itemId) {
    CancelTokenPtr token = makeCancelToken();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = running_.find(itemId);
        if (existing != running_.end()) {
            throw ConflictError("Item is already being processed: " + itemId);
        }
        running_[itemId] = token;
    }

    boost::asio::post(pool_, [this, userId, itemId, token]() {
        try {
            run(userId, itemId, token.get());
        } catch (const ConflictError& e) {
            std::cerr << "[pipeline] " << itemId << " dropped: " << e.what() << std::endl;
        } catch (const std::exception& e) {
            // Store failures while recording the error itself
            std::cerr << "[pipeline] " << itemId << " aborted: " << e.what() << std::endl;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_.erase(itemId);
        }
        idle_.notify_all();
    });
}

Item IngestionPipeline::submitAsync(const std::string& userId, const std::string& rawUrl) {
    Item item = submit(userId, rawUrl);
    schedule(userId, item.id);
    return item;
}

void IngestionPipeline::retryAsync(const std::string& userId, const std::string& itemId) {
    if (!store_.getItem(userId, itemId)) {
        throw NotFoundError("Item not found: " + itemId);
    }
    schedule(userId, itemId);
}

bool IngestionPipeline::cancel(const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(itemId);
    if (it == running_.end()) {
        return false;
    }
    it->second->cancel();
    return true;
}

void IngestionPipeline::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return running_.empty(); });
}

} // namespace later
