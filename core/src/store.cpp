#include "store.hpp"
#include "error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {

void exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}

struct Stmt {
    sqlite3* db{nullptr};
    sqlite3_stmt* st{nullptr};
    Stmt(sqlite3* d, const char* sql) : db(d) {
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Stmt() { if (st) sqlite3_finalize(st); }
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;

    void done(const char* what) {
        if (sqlite3_step(st) != SQLITE_DONE) {
            throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db));
        }
    }
    // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
    bool row(const char* what) {
        int rc = sqlite3_step(st);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db));
    }
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (!committed_ && sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            spdlog::warn("rollback failed: {}", sqlite3_errmsg(db_));
        }
    }
    void commit() { exec(db_, "COMMIT;"); committed_ = true; }

private:
    sqlite3* db_;
    bool committed_{false};
};

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void bind_opt_text(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
    if (v) bind_text(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    auto bytes = encode_embedding(v);
    sqlite3_bind_blob(st, idx, bytes.data(), (int)bytes.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, idx)) : std::string();
}

std::optional<std::string> column_opt_text(sqlite3_stmt* st, int idx) {
    if (sqlite3_column_type(st, idx) == SQLITE_NULL) return std::nullopt;
    return column_text(st, idx);
}

std::vector<float> column_embedding(sqlite3_stmt* st, int idx) {
    const void* blob = sqlite3_column_blob(st, idx);
    int bytes = sqlite3_column_bytes(st, idx);
    if (!blob || bytes <= 0) return {};
    return decode_embedding(blob, (size_t)bytes);
}

const char* kDocumentColumns =
    "SELECT id, title, content, file_path, file_type, content_hash, created_at, updated_at FROM documents ";

Document read_document(sqlite3_stmt* st) {
    Document d;
    d.id = column_text(st, 0);
    d.title = column_text(st, 1);
    d.content = column_text(st, 2);
    d.file_path = column_opt_text(st, 3);
    d.file_type = column_text(st, 4);
    d.content_hash = column_text(st, 5);
    d.created_at = column_text(st, 6);
    d.updated_at = column_text(st, 7);
    return d;
}

} // namespace

RagStore::RagStore(const std::string& db_path, std::size_t pool_size) : pool_(db_path, pool_size) {
    init();
    spdlog::info("vector store ready at {} ({} connection(s))", db_path, pool_.size());
}

void RagStore::init() {
    auto lease = pool_.acquire();
    exec(lease.get(), "CREATE TABLE IF NOT EXISTS documents (\n"
                      "  id TEXT PRIMARY KEY,\n"
                      "  title TEXT NOT NULL,\n"
                      "  content TEXT NOT NULL,\n"
                      "  file_path TEXT,\n"
                      "  file_type TEXT NOT NULL,\n"
                      "  content_hash TEXT NOT NULL,\n"
                      "  created_at TEXT NOT NULL,\n"
                      "  updated_at TEXT NOT NULL\n"
                      ");");
    exec(lease.get(), "CREATE TABLE IF NOT EXISTS document_chunks (\n"
                      "  id TEXT PRIMARY KEY,\n"
                      "  document_id TEXT NOT NULL,\n"
                      "  chunk_index INTEGER NOT NULL,\n"
                      "  content TEXT NOT NULL,\n"
                      "  embedding BLOB NOT NULL,\n"
                      "  created_at TEXT NOT NULL,\n"
                      "  FOREIGN KEY (document_id) REFERENCES documents (id) ON DELETE CASCADE\n"
                      ");");
    exec(lease.get(), "CREATE TABLE IF NOT EXISTS chat_messages (\n"
                      "  id TEXT PRIMARY KEY,\n"
                      "  content TEXT NOT NULL,\n"
                      "  role TEXT NOT NULL,\n"
                      "  document_references TEXT,\n"
                      "  created_at TEXT NOT NULL\n"
                      ");");
    exec(lease.get(), "CREATE INDEX IF NOT EXISTS idx_chunks_document_id ON document_chunks(document_id);");
    exec(lease.get(), "CREATE INDEX IF NOT EXISTS idx_messages_created_at ON chat_messages(created_at);");
}

void RagStore::insert_document(const Document& doc) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), "INSERT INTO documents \n"
                        "(id, title, content, file_path, file_type, content_hash, created_at, updated_at) \n"
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bind_text(s.st, 1, doc.id);
    bind_text(s.st, 2, doc.title);
    bind_text(s.st, 3, doc.content);
    bind_opt_text(s.st, 4, doc.file_path);
    bind_text(s.st, 5, doc.file_type);
    bind_text(s.st, 6, doc.content_hash);
    bind_text(s.st, 7, doc.created_at);
    bind_text(s.st, 8, doc.updated_at);
    s.done("insert document");
}

void RagStore::insert_chunks_batch(const std::vector<Chunk>& chunks) {
    if (chunks.empty()) return;
    const std::string& doc_id = chunks.front().document_id;
    const size_t dims = chunks.front().embedding.size();
    for (const auto& c : chunks) {
        if (c.document_id != doc_id) {
            throw std::invalid_argument("chunk batch spans several documents");
        }
        if (c.embedding.empty()) {
            throw std::invalid_argument("chunk " + std::to_string(c.chunk_index) + " has an empty embedding");
        }
        if (c.embedding.size() != dims) {
            throw std::invalid_argument("chunk batch mixes embedding dimensions " + std::to_string(dims) +
                                        " and " + std::to_string(c.embedding.size()));
        }
    }

    auto lease = pool_.acquire();
    Transaction tx(lease.get());
    {
        Stmt probe(lease.get(), "SELECT length(embedding) FROM document_chunks WHERE document_id = ? LIMIT 1;");
        bind_text(probe.st, 1, doc_id);
        if (probe.row("probe embedding size")) {
            size_t stored = (size_t)sqlite3_column_int64(probe.st, 0) / 4;
            if (stored != dims) {
                throw std::invalid_argument("document " + doc_id + " already holds " + std::to_string(stored) +
                                            "-dimensional embeddings, got " + std::to_string(dims));
            }
        }
    }
    Stmt ins(lease.get(), "INSERT INTO document_chunks \n"
                          "(id, document_id, chunk_index, content, embedding, created_at) \n"
                          "VALUES (?, ?, ?, ?, ?, ?);");
    for (const auto& c : chunks) {
        sqlite3_reset(ins.st);
        sqlite3_clear_bindings(ins.st);
        bind_text(ins.st, 1, c.id);
        bind_text(ins.st, 2, c.document_id);
        sqlite3_bind_int(ins.st, 3, c.chunk_index);
        bind_text(ins.st, 4, c.content);
        bind_blob(ins.st, 5, c.embedding);
        bind_text(ins.st, 6, c.created_at);
        ins.done("insert chunk");
    }
    tx.commit();
}

std::vector<Document> RagStore::list_documents() {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), (std::string(kDocumentColumns) + "ORDER BY created_at DESC, rowid DESC;").c_str());
    std::vector<Document> out;
    while (s.row("list documents")) out.push_back(read_document(s.st));
    return out;
}

std::optional<Document> RagStore::get_document(const std::string& id) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), (std::string(kDocumentColumns) + "WHERE id = ?;").c_str());
    bind_text(s.st, 1, id);
    if (!s.row("get document")) return std::nullopt;
    return read_document(s.st);
}

std::vector<Document> RagStore::find_documents_by_hash(const std::string& content_hash) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), (std::string(kDocumentColumns) + "WHERE content_hash = ? ORDER BY created_at, rowid;").c_str());
    bind_text(s.st, 1, content_hash);
    std::vector<Document> out;
    while (s.row("find documents by hash")) out.push_back(read_document(s.st));
    return out;
}

bool RagStore::touch_document(const std::string& id, const std::string& updated_at) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), "UPDATE documents SET updated_at = ? WHERE id = ?;");
    bind_text(s.st, 1, updated_at);
    bind_text(s.st, 2, id);
    s.done("touch document");
    return sqlite3_changes(lease.get()) > 0;
}

bool RagStore::delete_document(const std::string& id) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), "DELETE FROM documents WHERE id = ?;");
    bind_text(s.st, 1, id);
    s.done("delete document");
    return sqlite3_changes(lease.get()) > 0;
}

void RagStore::for_each_chunk(const std::function<void(const ScannedChunk&)>& fn) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), "SELECT dc.id, dc.document_id, dc.chunk_index, dc.content, dc.embedding, d.title, d.file_path\n"
                        "FROM document_chunks dc\n"
                        "JOIN documents d ON dc.document_id = d.id\n"
                        "ORDER BY d.created_at, d.rowid, dc.chunk_index;");
    while (s.row("scan chunks")) {
        ScannedChunk c;
        c.chunk_id = column_text(s.st, 0);
        c.document_id = column_text(s.st, 1);
        c.chunk_index = sqlite3_column_int(s.st, 2);
        c.content = column_text(s.st, 3);
        c.embedding = column_embedding(s.st, 4);
        c.document_title = column_text(s.st, 5);
        c.file_path = column_opt_text(s.st, 6);
        fn(c);
    }
}

std::vector<Chunk> RagStore::list_chunks(const std::string& document_id) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), "SELECT id, document_id, chunk_index, content, embedding, created_at\n"
                        "FROM document_chunks WHERE document_id = ? ORDER BY chunk_index;");
    bind_text(s.st, 1, document_id);
    std::vector<Chunk> out;
    while (s.row("list chunks")) {
        Chunk c;
        c.id = column_text(s.st, 0);
        c.document_id = column_text(s.st, 1);
        c.chunk_index = sqlite3_column_int(s.st, 2);
        c.content = column_text(s.st, 3);
        c.embedding = column_embedding(s.st, 4);
        c.created_at = column_text(s.st, 5);
        out.push_back(std::move(c));
    }
    return out;
}

std::size_t RagStore::count_chunks(const std::string& document_id) {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), "SELECT COUNT(*) FROM document_chunks WHERE document_id = ?;");
    bind_text(s.st, 1, document_id);
    if (!s.row("count chunks")) return 0;
    return (std::size_t)sqlite3_column_int64(s.st, 0);
}

void RagStore::insert_messages(const std::vector<ChatMessage>& messages) {
    auto lease = pool_.acquire();
    Transaction tx(lease.get());
    Stmt s(lease.get(), "INSERT INTO chat_messages (id, content, role, document_references, created_at)\n"
                        "VALUES (?, ?, ?, ?, ?);");
    for (const auto& m : messages) {
        sqlite3_reset(s.st);
        sqlite3_clear_bindings(s.st);
        bind_text(s.st, 1, m.id);
        bind_text(s.st, 2, m.content);
        bind_text(s.st, 3, m.role);
        bind_text(s.st, 4, json(m.document_references).dump());
        bind_text(s.st, 5, m.created_at);
        s.done("insert message");
    }
    tx.commit();
}

std::vector<ChatMessage> RagStore::list_messages() {
    auto lease = pool_.acquire();
    Stmt s(lease.get(), "SELECT id, content, role, document_references, created_at\n"
                        "FROM chat_messages ORDER BY created_at ASC, rowid ASC;");
    std::vector<ChatMessage> out;
    while (s.row("list messages")) {
        ChatMessage m;
        m.id = column_text(s.st, 0);
        m.content = column_text(s.st, 1);
        m.role = column_text(s.st, 2);
        json refs = json::parse(column_text(s.st, 3), nullptr, false);
        if (refs.is_array()) {
            for (const auto& r : refs) {
                if (r.is_string()) m.document_references.push_back(r.get<std::string>());
            }
        } else {
            spdlog::warn("message {} has unreadable document references", m.id);
        }
        m.created_at = column_text(s.st, 4);
        out.push_back(std::move(m));
    }
    return out;
}

void RagStore::clear() {
    auto lease = pool_.acquire();
    Transaction tx(lease.get());
    exec(lease.get(), "DELETE FROM documents;");
    exec(lease.get(), "DELETE FROM chat_messages;");
    tx.commit();
}
