#pragma once

#include "core/Item.hpp"
#include <optional>
#include <string>
#include <vector>

namespace later {

struct NewItem {
    std::string userId;
    std::string url;
    std::optional<std::string> canonicalUrl;
};

// Which items an analysis or listing covers.
struct ItemFilter {
    std::optional<ClientStatus> clientStatus;
    std::vector<std::string> itemIds;   // empty = no id restriction
};

struct ItemVector {
    std::string id;
    std::vector<float> vector;
};

struct ChunkVector {
    int position = 0;
    std::vector<float> vector;
};

struct ChunkRecord {
    std::string itemId;
    int position = 0;
    std::string text;
    std::vector<float> vector;
};

struct ItemSummary {
    std::string id;
    std::string summary;
};

struct LexicalHit {
    std::string itemId;
    std::optional<int> position;   // set for chunk hits
    double score = 0.0;            // higher is better
    std::string preview;
    Timestamp createdAt = 0;
};

// Data-access seam. Every call is scoped to one user; nothing leaks across users.
class ItemStore {
public:
    virtual ~ItemStore() = default;

    // Throws ConflictError on duplicate (user, url) or (user, canonical_url).
    virtual Item createItem(const NewItem& item) = 0;

    virtual std::optional<Item> getItem(const std::string& userId, const std::string& itemId) = 0;

    virtual std::vector<Item> listItems(const std::string& userId, const ItemFilter& filter) = 0;

    // Returns false when the item no longer exists. Throws ConflictError when a new
    // canonical URL collides with another row of the same user.
    virtual bool updateItem(const std::string& userId, const std::string& itemId,
                            const ItemUpdate& update) = 0;

    virtual bool deleteItem(const std::string& userId, const std::string& itemId) = 0;

    // Replaces the chunk set of an item.
    virtual void insertChunks(const std::string& userId, const std::string& itemId,
                              const std::vector<Chunk>& chunks) = 0;

    // Item embedding, chunks and status in one transaction: all or nothing.
    virtual bool storeEmbeddings(const std::string& userId, const std::string& itemId,
                                 const std::vector<float>& embedding,
                                 const std::vector<Chunk>& chunks,
                                 const ItemUpdate& update) = 0;

    // Items matching the filter that have an embedding.
    virtual std::vector<ItemVector> getItemVectors(const std::string& userId,
                                                   const ItemFilter& filter) = 0;

    virtual std::vector<ChunkVector> getChunkVectors(const std::string& userId,
                                                     const std::string& itemId) = 0;

    virtual std::vector<ChunkRecord> getUserChunkVectors(const std::string& userId) = 0;

    virtual std::vector<ItemSummary> getItemSummaries(const std::string& userId,
                                                      const std::vector<std::string>& itemIds) = 0;

    virtual std::vector<LexicalHit> lexicalSearchItems(const std::string& userId,
                                                       const std::string& query, int limit) = 0;

    virtual std::vector<LexicalHit> lexicalSearchChunks(const std::string& userId,
                                                        const std::string& query, int limit) = 0;
};

} // namespace later
