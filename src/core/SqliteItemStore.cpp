#include "core/SqliteItemStore.hpp"
#include "core/Errors.hpp"
#include <sqlite3.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <cstring>
#include <iostream>
#include <unordered_map>

namespace later {

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS items (
    id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    url TEXT NOT NULL,
    canonical_url TEXT,
    title TEXT,
    source_site TEXT,
    publication_date TEXT,
    favicon_url TEXT,
    content_markdown TEXT,
    content_text TEXT,
    content_token_count INTEGER,
    client_status TEXT NOT NULL,
    server_status TEXT NOT NULL DEFAULT 'saved',
    summary TEXT,
    expiry_score REAL,
    embedding BLOB,
    error_message TEXT,
    client_status_at INTEGER,
    server_status_at INTEGER,
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS item_chunks (
    item_id TEXT NOT NULL REFERENCES items(id) ON DELETE CASCADE,
    position INTEGER NOT NULL,
    content_text TEXT,
    content_token_count INTEGER,
    embedding BLOB,
    created_at INTEGER NOT NULL,
    UNIQUE (item_id, position)
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_items_user_url ON items(user_id, url);
CREATE UNIQUE INDEX IF NOT EXISTS idx_items_user_canonical_url
    ON items(user_id, canonical_url) WHERE canonical_url IS NOT NULL;
CREATE INDEX IF NOT EXISTS idx_items_user_client_status ON items(user_id, client_status);

CREATE VIRTUAL TABLE IF NOT EXISTS items_fts USING fts5(
    content_text, content='items', content_rowid='rowid', tokenize='porter unicode61'
);
CREATE VIRTUAL TABLE IF NOT EXISTS chunks_fts USING fts5(
    content_text, content='item_chunks', content_rowid='rowid', tokenize='porter unicode61'
);

CREATE TRIGGER IF NOT EXISTS items_fts_ai AFTER INSERT ON items BEGIN
    INSERT INTO items_fts(rowid, content_text) VALUES (new.rowid, new.content_text);
END;
CREATE TRIGGER IF NOT EXISTS items_fts_ad AFTER DELETE ON items BEGIN
    INSERT INTO items_fts(items_fts, rowid, content_text) VALUES ('delete', old.rowid, old.content_text);
END;
CREATE TRIGGER IF NOT EXISTS items_fts_au AFTER UPDATE OF content_text ON items BEGIN
    INSERT INTO items_fts(items_fts, rowid, content_text) VALUES ('delete', old.rowid, old.content_text);
    INSERT INTO items_fts(rowid, content_text) VALUES (new.rowid, new.content_text);
END;

CREATE TRIGGER IF NOT EXISTS chunks_fts_ai AFTER INSERT ON item_chunks BEGIN
    INSERT INTO chunks_fts(rowid, content_text) VALUES (new.rowid, new.content_text);
END;
CREATE TRIGGER IF NOT EXISTS chunks_fts_ad AFTER DELETE ON item_chunks BEGIN
    INSERT INTO chunks_fts(chunks_fts, rowid, content_text) VALUES ('delete', old.rowid, old.content_text);
END;
)SQL";

const char* kItemColumns =
    "id, user_id, url, canonical_url, title, source_site, publication_date, favicon_url, "
    "content_markdown, content_text, content_token_count, client_status, server_status, "
    "summary, expiry_score, embedding, error_message, created_at, client_status_at, "
    "server_status_at";

// Prepared statement owned for one call.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("SQL prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }
    void bind(int index, std::int64_t value) { check(sqlite3_bind_int64(stmt_, index, value)); }
    void bind(int index, int value) { check(sqlite3_bind_int(stmt_, index, value)); }
    void bind(int index, double value) { check(sqlite3_bind_double(stmt_, index, value)); }
    void bindNull(int index) { check(sqlite3_bind_null(stmt_, index)); }
    void bind(int index, const std::vector<float>& vec) {
        if (vec.empty()) {
            bindNull(index);
            return;
        }
        check(sqlite3_bind_blob(stmt_, index, vec.data(),
                                static_cast<int>(vec.size() * sizeof(float)), SQLITE_TRANSIENT));
    }
    template <typename T>
    void bind(int index, const std::optional<T>& value) {
        if (value) bind(index, *value);
        else bindNull(index);
    }

    // True while rows remain. Constraint violations surface as ConflictError.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            int ext = sqlite3_extended_errcode(db_);
            if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY) {
                throw ConflictError(std::string("Duplicate item: ") + sqlite3_errmsg(db_));
            }
        }
        throw StoreError(std::string("SQL step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {}
    }

    bool isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(stmt_, col);
        if (!value) return {};
        return std::string(reinterpret_cast<const char*>(value),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }
    std::optional<std::string> optText(int col) const {
        if (isNull(col)) return std::nullopt;
        return text(col);
    }
    std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    std::vector<float> vector(int col) const {
        std::vector<float> out;
        const void* blob = sqlite3_column_blob(stmt_, col);
        int bytes = sqlite3_column_bytes(stmt_, col);
        if (blob && bytes > 0) {
            out.resize(static_cast<size_t>(bytes) / sizeof(float));
            std::memcpy(out.data(), blob, out.size() * sizeof(float));
        }
        return out;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("SQL bind failed: ") + sqlite3_errmsg(db_));
        }
    }
};

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { execRaw("BEGIN IMMEDIATE"); }

    ~Transaction() {
        if (!done_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    void commit() {
        execRaw("COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;

    void execRaw(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string message = err ? err : "unknown error";
            sqlite3_free(err);
            throw StoreError(std::string(sql) + " failed: " + message);
        }
    }
};

Item readItem(const Statement& s) {
    Item item;
    item.id = s.text(0);
    item.userId = s.text(1);
    item.url = s.text(2);
    item.canonicalUrl = s.optText(3);
    item.title = s.optText(4);
    item.sourceSite = s.optText(5);
    item.publicationDate = s.optText(6);
    item.faviconUrl = s.optText(7);
    item.contentMarkdown = s.optText(8);
    item.contentText = s.optText(9);
    if (!s.isNull(10)) item.tokenCount = static_cast<int>(s.int64(10));
    item.clientStatus = clientStatusFromString(s.text(11));
    item.serverStatus = serverStatusFromString(s.text(12));
    item.summary = s.optText(13);
    if (!s.isNull(14)) item.expiryScore = s.real(14);
    item.embedding = s.vector(15);
    item.errorMessage = s.optText(16);
    item.createdAt = s.int64(17);
    item.clientStatusAt = s.int64(18);
    item.serverStatusAt = s.int64(19);
    return item;
}

std::string placeholders(size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += (i == 0) ? "?" : ", ?";
    }
    return out;
}

std::string newItemId() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

void checkChunkPositions(const std::vector<Chunk>& chunks) {
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].position != static_cast<int>(i)) {
            throw ValidationError("Chunk positions must be contiguous from 0");
        }
    }
}

} // namespace

std::string buildMatchExpression(const std::string& text) {
    std::string expr;
    std::string word;
    auto flush = [&]() {
        if (word.empty()) return;
        if (!expr.empty()) expr += ' ';
        expr += '"' + word + '"';
        word.clear();
    };
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || uc >= 0x80) {
            word += c;
        } else {
            flush();
        }
    }
    flush();
    return expr;
}

SqliteItemStore::SqliteItemStore(const std::string& path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Cannot open database " + path + ": " + message);
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA foreign_keys = ON");
    if (path != ":memory:") {
        exec("PRAGMA journal_mode = WAL");
    }
    initSchema();
}

SqliteItemStore::~SqliteItemStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteItemStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("SQL exec failed: " + message);
    }
}

void SqliteItemStore::initSchema() {
    exec(kSchema);
}

bool SqliteItemStore::ownsItem(const std::string& userId, const std::string& itemId) {
    Statement s(db_, "SELECT 1 FROM items WHERE id = ? AND user_id = ?");
    s.bind(1, itemId);
    s.bind(2, userId);
    return s.step();
}

Item SqliteItemStore::createItem(const NewItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);

    Item created;
    created.id = newItemId();
    created.userId = item.userId;
    created.url = item.url;
    created.canonicalUrl = item.canonicalUrl;
    created.clientStatus = ClientStatus::Adding;
    created.serverStatus = ServerStatus::Saved;
    created.createdAt = nowMillis();
    created.clientStatusAt = created.createdAt;
    created.serverStatusAt = created.createdAt;

    Statement s(db_,
        "INSERT INTO items (id, user_id, url, canonical_url, client_status, server_status, "
        "client_status_at, server_status_at, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    s.bind(1, created.id);
    s.bind(2, created.userId);
    s.bind(3, created.url);
    s.bind(4, created.canonicalUrl);
    s.bind(5, std::string(to_string(created.clientStatus)));
    s.bind(6, std::string(to_string(created.serverStatus)));
    s.bind(7, created.clientStatusAt);
    s.bind(8, created.serverStatusAt);
    s.bind(9, created.createdAt);
    s.run();
    return created;
}

std::optional<Item> SqliteItemStore::getItem(const std::string& userId, const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_, std::string("SELECT ") + kItemColumns +
                     " FROM items WHERE id = ? AND user_id = ?");
    s.bind(1, itemId);
    s.bind(2, userId);
    if (!s.step()) {
        return std::nullopt;
    }
    return readItem(s);
}

std::vector<Item> SqliteItemStore::listItems(const std::string& userId, const ItemFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kItemColumns + " FROM items WHERE user_id = ?";
    if (filter.clientStatus) sql += " AND client_status = ?";
    if (!filter.itemIds.empty()) sql += " AND id IN (" + placeholders(filter.itemIds.size()) + ")";
    sql += " ORDER BY created_at DESC, id";

    Statement s(db_, sql);
    int index = 1;
    s.bind(index++, userId);
    if (filter.clientStatus) s.bind(index++, std::string(to_string(*filter.clientStatus)));
    for (const auto& id : filter.itemIds) s.bind(index++, id);

    std::vector<Item> items;
    while (s.step()) {
        items.push_back(readItem(s));
    }
    return items;
}

bool SqliteItemStore::applyUpdate(const std::string& userId, const std::string& itemId,
                                  const ItemUpdate& update) {
    if (update.empty()) {
        return ownsItem(userId, itemId);
    }

    std::vector<std::string> sets;
    if (update.canonicalUrl) sets.push_back("canonical_url = ?");
    if (update.title) sets.push_back("title = ?");
    if (update.sourceSite) sets.push_back("source_site = ?");
    if (update.publicationDate) sets.push_back("publication_date = ?");
    if (update.faviconUrl) sets.push_back("favicon_url = ?");
    if (update.contentMarkdown) sets.push_back("content_markdown = ?");
    if (update.contentText) sets.push_back("content_text = ?");
    if (update.tokenCount) sets.push_back("content_token_count = ?");
    if (update.clientStatus) {
        sets.push_back("client_status = ?");
        sets.push_back("client_status_at = ?");
    }
    if (update.serverStatus) {
        sets.push_back("server_status = ?");
        sets.push_back("server_status_at = ?");
    }
    if (update.summary) sets.push_back("summary = ?");
    if (update.expiryScore) sets.push_back("expiry_score = ?");
    if (update.errorMessage) sets.push_back("error_message = ?");
    else if (update.clearError) sets.push_back("error_message = NULL");

    std::string sql = "UPDATE items SET ";
    for (size_t i = 0; i < sets.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += sets[i];
    }
    sql += " WHERE id = ? AND user_id = ?";

    Timestamp now = nowMillis();
    Statement s(db_, sql);
    int index = 1;
    if (update.canonicalUrl) s.bind(index++, *update.canonicalUrl);
    if (update.title) s.bind(index++, *update.title);
    if (update.sourceSite) s.bind(index++, *update.sourceSite);
    if (update.publicationDate) s.bind(index++, *update.publicationDate);
    if (update.faviconUrl) s.bind(index++, *update.faviconUrl);
    if (update.contentMarkdown) s.bind(index++, *update.contentMarkdown);
    if (update.contentText) s.bind(index++, *update.contentText);
    if (update.tokenCount) s.bind(index++, *update.tokenCount);
    if (update.clientStatus) {
        s.bind(index++, std::string(to_string(*update.clientStatus)));
        s.bind(index++, now);
    }
    if (update.serverStatus) {
        s.bind(index++, std::string(to_string(*update.serverStatus)));
        s.bind(index++, now);
    }
    if (update.summary) s.bind(index++, *update.summary);
    if (update.expiryScore) s.bind(index++, *update.expiryScore);
    if (update.errorMessage) s.bind(index++, *update.errorMessage);
    s.bind(index++, itemId);
    s.bind(index++, userId);
    s.run();
    return sqlite3_changes(db_) > 0;
}

bool SqliteItemStore::updateItem(const std::string& userId, const std::string& itemId,
                                 const ItemUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    return applyUpdate(userId, itemId, update);
}

bool SqliteItemStore::deleteItem(const std::string& userId, const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_, "DELETE FROM items WHERE id = ? AND user_id = ?");
    s.bind(1, itemId);
    s.bind(2, userId);
    s.run();
    return sqlite3_changes(db_) > 0;
}

void SqliteItemStore::replaceChunks(const std::string& itemId, const std::vector<Chunk>& chunks) {
    checkChunkPositions(chunks);

    Statement del(db_, "DELETE FROM item_chunks WHERE item_id = ?");
    del.bind(1, itemId);
    del.run();

    Timestamp now = nowMillis();
    for (const auto& chunk : chunks) {
        Statement ins(db_,
            "INSERT INTO item_chunks (item_id, position, content_text, content_token_count, "
            "embedding, created_at) VALUES (?, ?, ?, ?, ?, ?)");
        ins.bind(1, itemId);
        ins.bind(2, chunk.position);
        ins.bind(3, chunk.text);
        ins.bind(4, chunk.tokenCount);
        ins.bind(5, chunk.embedding);
        ins.bind(6, now);
        ins.run();
    }
}

void SqliteItemStore::insertChunks(const std::string& userId, const std::string& itemId,
                                   const std::vector<Chunk>& chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    if (!ownsItem(userId, itemId)) {
        throw NotFoundError("Item not found: " + itemId);
    }
    replaceChunks(itemId, chunks);
    tx.commit();
}

bool SqliteItemStore::storeEmbeddings(const std::string& userId, const std::string& itemId,
                                      const std::vector<float>& embedding,
                                      const std::vector<Chunk>& chunks,
                                      const ItemUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    Statement s(db_, "UPDATE items SET embedding = ? WHERE id = ? AND user_id = ?");
    s.bind(1, embedding);
    s.bind(2, itemId);
    s.bind(3, userId);
    s.run();
    if (sqlite3_changes(db_) == 0) {
        return false;
    }

    replaceChunks(itemId, chunks);
    applyUpdate(userId, itemId, update);
    tx.commit();
    return true;
}

std::vector<ItemVector> SqliteItemStore::getItemVectors(const std::string& userId,
                                                        const ItemFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = "SELECT id, embedding FROM items WHERE user_id = ? AND embedding IS NOT NULL";
    if (filter.clientStatus) sql += " AND client_status = ?";
    if (!filter.itemIds.empty()) sql += " AND id IN (" + placeholders(filter.itemIds.size()) + ")";
    sql += " ORDER BY created_at, id";

    Statement s(db_, sql);
    int index = 1;
    s.bind(index++, userId);
    if (filter.clientStatus) s.bind(index++, std::string(to_string(*filter.clientStatus)));
    for (const auto& id : filter.itemIds) s.bind(index++, id);

    std::vector<ItemVector> out;
    while (s.step()) {
        out.push_back({s.text(0), s.vector(1)});
    }
    return out;
}

std::vector<ChunkVector> SqliteItemStore::getChunkVectors(const std::string& userId,
                                                          const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "SELECT c.position, c.embedding FROM item_chunks AS c "
        "JOIN items AS i ON i.id = c.item_id "
        "WHERE i.user_id = ? AND c.item_id = ? AND c.embedding IS NOT NULL "
        "ORDER BY c.position");
    s.bind(1, userId);
    s.bind(2, itemId);

    std::vector<ChunkVector> out;
    while (s.step()) {
        out.push_back({static_cast<int>(s.int64(0)), s.vector(1)});
    }
    return out;
}

std::vector<ChunkRecord> SqliteItemStore::getUserChunkVectors(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "SELECT c.item_id, c.position, c.content_text, c.embedding FROM item_chunks AS c "
        "JOIN items AS i ON i.id = c.item_id "
        "WHERE i.user_id = ? AND c.embedding IS NOT NULL "
        "ORDER BY c.item_id, c.position");
    s.bind(1, userId);

    std::vector<ChunkRecord> out;
    while (s.step()) {
        ChunkRecord record;
        record.itemId = s.text(0);
        record.position = static_cast<int>(s.int64(1));
        record.text = s.text(2);
        record.vector = s.vector(3);
        out.push_back(std::move(record));
    }
    return out;
}

std::vector<ItemSummary> SqliteItemStore::getItemSummaries(const std::string& userId,
                                                           const std::vector<std::string>& itemIds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (itemIds.empty()) {
        return {};
    }

    Statement s(db_, "SELECT id, summary FROM items WHERE user_id = ? AND id IN (" +
                     placeholders(itemIds.size()) + ")");
    int index = 1;
    s.bind(index++, userId);
    for (const auto& id : itemIds) s.bind(index++, id);

    std::unordered_map<std::string, std::string> byId;
    while (s.step()) {
        byId[s.text(0)] = s.text(1);
    }

    // IN does not preserve order; align with the caller's sequence.
    std::vector<ItemSummary> out;
    for (const auto& id : itemIds) {
        auto it = byId.find(id);
        if (it != byId.end()) {
            out.push_back({id, it->second});
        }
    }
    return out;
}

std::vector<LexicalHit> SqliteItemStore::lexicalSearchItems(const std::string& userId,
                                                            const std::string& query, int limit) {
    if (limit <= 0) {
        throw ValidationError("Limit must be positive");
    }
    std::string match = buildMatchExpression(query);
    if (match.empty()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "SELECT i.id, -bm25(items_fts) AS score, "
        "snippet(items_fts, 0, '', '', '...', 32) AS preview, i.created_at "
        "FROM items_fts JOIN items AS i ON i.rowid = items_fts.rowid "
        "WHERE items_fts MATCH ? AND i.user_id = ? "
        "ORDER BY score DESC, i.created_at DESC LIMIT ?");
    s.bind(1, match);
    s.bind(2, userId);
    s.bind(3, limit);

    std::vector<LexicalHit> out;
    while (s.step()) {
        LexicalHit hit;
        hit.itemId = s.text(0);
        hit.score = s.real(1);
        hit.preview = s.text(2);
        hit.createdAt = s.int64(3);
        out.push_back(std::move(hit));
    }
    return out;
}

std::vector<LexicalHit> SqliteItemStore::lexicalSearchChunks(const std::string& userId,
                                                             const std::string& query, int limit) {
    if (limit <= 0) {
        throw ValidationError("Limit must be positive");
    }
    std::string match = buildMatchExpression(query);
    if (match.empty()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "SELECT c.item_id, c.position, -bm25(chunks_fts) AS score, c.content_text, i.created_at "
        "FROM chunks_fts JOIN item_chunks AS c ON c.rowid = chunks_fts.rowid "
        "JOIN items AS i ON i.id = c.item_id "
        "WHERE chunks_fts MATCH ? AND i.user_id = ? "
        "ORDER BY score DESC, i.created_at DESC LIMIT ?");
    s.bind(1, match);
    s.bind(2, userId);
    s.bind(3, limit);

    std::vector<LexicalHit> out;
    while (s.step()) {
        LexicalHit hit;
        hit.itemId = s.text(0);
        hit.position = static_cast<int>(s.int64(1));
        hit.score = s.real(2);
        hit.preview = s.text(3);
        hit.createdAt = s.int64(4);
        out.push_back(std::move(hit));
    }
    return out;
}

int SqliteItemStore::countChunks(const std::string& userId, const std::string& itemId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "SELECT COUNT(*) FROM item_chunks AS c JOIN items AS i ON i.id = c.item_id "
        "WHERE i.user_id = ? AND c.item_id = ?");
    s.bind(1, userId);
    s.bind(2, itemId);
    s.step();
    return static_cast<int>(s.int64(0));
}

} // namespace later
