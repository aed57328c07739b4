#pragma once
#include "connection_pool.hpp"
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// SQLite persistence for documents, their chunks and chat messages. Every
// method leases one pooled connection; writes run in their own transaction.
class RagStore {
public:
    explicit RagStore(const std::string& db_path, std::size_t pool_size = 4);

    void insert_document(const Document& doc);
    // All chunks must belong to one document and share one non-zero
    // embedding dimensionality, matching chunks already stored for it.
    void insert_chunks_batch(const std::vector<Chunk>& chunks);

    std::vector<Document> list_documents();
    std::optional<Document> get_document(const std::string& id);
    std::vector<Document> find_documents_by_hash(const std::string& content_hash);
    bool touch_document(const std::string& id, const std::string& updated_at);
    bool delete_document(const std::string& id);

    // Streams every chunk joined with its parent document, ordered by
    // document age then chunk index. The callback must not call back into
    // the store.
    void for_each_chunk(const std::function<void(const ScannedChunk&)>& fn);
    std::vector<Chunk> list_chunks(const std::string& document_id);
    std::size_t count_chunks(const std::string& document_id);

    void insert_messages(const std::vector<ChatMessage>& messages);
    std::vector<ChatMessage> list_messages();

    void clear();

private:
    void init();

    ConnectionPool pool_;
};
