#pragma once

#include "core/ItemStore.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace later {

// ItemStore over a single SQLite database. Full-text search runs on FTS5 tables kept
// in sync by triggers; vectors are float BLOBs ranked in process by the caller.
class SqliteItemStore : public ItemStore {
public:
    // ":memory:" gives a private in-memory database.
    explicit SqliteItemStore(const std::string& path);
    ~SqliteItemStore() override;

    SqliteItemStore(const SqliteItemStore&) = delete;
    SqliteItemStore& operator=(const SqliteItemStore&) = delete;

    Item createItem(const NewItem& item) override;
    std::optional<Item> getItem(const std::string& userId, const std::string& itemId) override;
    std::vector<Item> listItems(const std::string& userId, const ItemFilter& filter) override;
    bool updateItem(const std::string& userId, const std::string& itemId,
                    const ItemUpdate& update) override;
    bool deleteItem(const std::string& userId, const std::string& itemId) override;

    void insertChunks(const std::string& userId, const std::string& itemId,
                      const std::vector<Chunk>& chunks) override;
    bool storeEmbeddings(const std::string& userId, const std::string& itemId,
                         const std::vector<float>& embedding,
                         const std::vector<Chunk>& chunks,
                         const ItemUpdate& update) override;

    std::vector<ItemVector> getItemVectors(const std::string& userId,
                                           const ItemFilter& filter) override;
    std::vector<ChunkVector> getChunkVectors(const std::string& userId,
                                             const std::string& itemId) override;
    std::vector<ChunkRecord> getUserChunkVectors(const std::string& userId) override;
    std::vector<ItemSummary> getItemSummaries(const std::string& userId,
                                              const std::vector<std::string>& itemIds) override;

    std::vector<LexicalHit> lexicalSearchItems(const std::string& userId,
                                               const std::string& query, int limit) override;
    std::vector<LexicalHit> lexicalSearchChunks(const std::string& userId,
                                                const std::string& query, int limit) override;

    int countChunks(const std::string& userId, const std::string& itemId);

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void initSchema();
    void exec(const std::string& sql);
    bool ownsItem(const std::string& userId, const std::string& itemId);
    bool applyUpdate(const std::string& userId, const std::string& itemId,
                     const ItemUpdate& update);
    void replaceChunks(const std::string& itemId, const std::vector<Chunk>& chunks);
};

// Turns free text into an FTS5 MATCH expression: every word quoted, all required.
// Returns an empty string when the text holds no searchable word.
std::string buildMatchExpression(const std::string& text);

} // namespace later
