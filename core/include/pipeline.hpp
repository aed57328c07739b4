#pragma once
#include "config.hpp"
#include "embeddings.hpp"
#include "retriever.hpp"
#include "store.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Notifications for the UI layer. Called from the ingestion worker thread.
class PipelineEvents {
public:
    virtual ~PipelineEvents() = default;
    virtual void document_processed(const std::string& document_id) = 0;
};

struct IngestTicket {
    Document document;                 // already persisted and visible
    std::future<IngestResult> result;  // ready once chunk processing ends
    bool duplicate{false};             // skip policy matched an existing document
};

class RagPipeline {
public:
    RagPipeline(RagStore& store, const Embedder& embedder, PipelineEvents* events = nullptr);
    ~RagPipeline();
    RagPipeline(const RagPipeline&) = delete;
    RagPipeline& operator=(const RagPipeline&) = delete;

    // Extraction, hashing and the document insert happen on the calling
    // thread and throw on failure. Chunking, embedding and chunk inserts run
    // on a worker; their failure is reported through the result with
    // success == false and the number of chunks actually committed.
    IngestTicket ingest_async(const std::filesystem::path& path, const std::optional<std::string>& title,
                              const RagConfig& cfg);
    IngestResult ingest(const std::filesystem::path& path, const std::optional<std::string>& title,
                        const RagConfig& cfg);

    RagResponse query(const std::string& question, RagMode mode, const RagConfig& cfg);

    std::vector<Document> list_documents();
    bool delete_document(const std::string& id);
    std::vector<DocumentMatch> search_documents(const std::string& query, const RagConfig& cfg);
    ChatResponse chat(const std::string& message, const RagConfig& cfg);
    std::vector<ChatMessage> chat_history();

    // Blocks until every ingestion worker has finished.
    void wait_idle();

private:
    struct Job {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    Document create_document(const std::filesystem::path& path, const std::optional<std::string>& title,
                             const RagConfig& cfg, bool& duplicate);
    IngestResult run_job(const Document& doc, const RagConfig& cfg, std::chrono::steady_clock::time_point start);
    void process_chunks(const Document& doc, const RagConfig& cfg, std::size_t& committed);
    void notify_processed(const std::string& id);
    void reap_finished();

    RagStore& store_;
    const Embedder& embedder_;
    Retriever retriever_;
    PipelineEvents* events_;

    std::mutex jobs_mtx_;
    std::vector<Job> jobs_;
};
