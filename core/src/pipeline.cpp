#include "pipeline.hpp"
#include "answer.hpp"
#include "chunker.hpp"
#include "extractor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

using Clock = std::chrono::steady_clock;

static std::uint64_t elapsed_ms_since(Clock::time_point start) {
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

RagPipeline::RagPipeline(RagStore& store, const Embedder& embedder, PipelineEvents* events)
    : store_(store), embedder_(embedder), retriever_(store, embedder), events_(events) {}

RagPipeline::~RagPipeline() {
    wait_idle();
}

Document RagPipeline::create_document(const std::filesystem::path& path, const std::optional<std::string>& title,
                                      const RagConfig& cfg, bool& duplicate) {
    if (!std::filesystem::is_regular_file(path)) {
        throw std::runtime_error("file not found: " + path.string());
    }
    Document doc;
    doc.file_type = infer_file_type(path);
    doc.content = extract_text(path, doc.file_type);
    doc.content_hash = sha256_hex(doc.content);
    duplicate = false;

    if (cfg.duplicate_policy == DuplicatePolicy::Skip) {
        auto existing = store_.find_documents_by_hash(doc.content_hash);
        if (!existing.empty()) {
            Document found = existing.front();
            found.updated_at = now_rfc3339();
            store_.touch_document(found.id, found.updated_at);
            spdlog::info("{} matches existing document {}, skipping", path.string(), found.id);
            duplicate = true;
            return found;
        }
    }

    auto name = path.filename().string();
    doc.id = gen_id();
    doc.title = title && !title->empty() ? *title : (name.empty() ? std::string("Unknown") : name);
    doc.file_path = path.string();
    doc.created_at = now_rfc3339();
    doc.updated_at = doc.created_at;
    store_.insert_document(doc);
    return doc;
}

IngestTicket RagPipeline::ingest_async(const std::filesystem::path& path, const std::optional<std::string>& title,
                                       const RagConfig& cfg) {
    validate_config(cfg);
    const auto start = Clock::now();
    IngestTicket ticket;
    ticket.document = create_document(path, title, cfg, ticket.duplicate);
    spdlog::info("ingesting {} as document {} ({})", path.string(), ticket.document.id, ticket.document.file_type);

    if (ticket.duplicate) {
        std::promise<IngestResult> ready;
        IngestResult res;
        res.success = true;
        res.message = "Document already ingested: " + ticket.document.title;
        res.elapsed_ms = elapsed_ms_since(start);
        res.document = ticket.document;
        ready.set_value(std::move(res));
        ticket.result = ready.get_future();
        return ticket;
    }

    reap_finished();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::packaged_task<IngestResult()> task([this, doc = ticket.document, cfg, start, done]() {
        IngestResult res = run_job(doc, cfg, start);
        done->store(true);
        return res;
    });
    ticket.result = task.get_future();
    std::lock_guard<std::mutex> lock(jobs_mtx_);
    jobs_.push_back(Job{std::thread(std::move(task)), done});
    return ticket;
}

IngestResult RagPipeline::ingest(const std::filesystem::path& path, const std::optional<std::string>& title,
                                 const RagConfig& cfg) {
    auto ticket = ingest_async(path, title, cfg);
    return ticket.result.get();
}

IngestResult RagPipeline::run_job(const Document& doc, const RagConfig& cfg, Clock::time_point start) {
    IngestResult res;
    res.document = doc;
    std::size_t committed = 0;
    try {
        process_chunks(doc, cfg, committed);
        res.success = true;
        res.message = "Successfully processed document: " + doc.title;
    } catch (const std::exception& e) {
        spdlog::error("chunk processing failed for document {}: {}", doc.id, e.what());
        res.success = false;
        res.message = "Error processing chunks for " + doc.title + ": " + e.what();
    }
    res.chunks_created = committed;
    res.elapsed_ms = elapsed_ms_since(start);
    spdlog::info("document {} processed: {} chunk(s) in {} ms", doc.id, committed, res.elapsed_ms);
    notify_processed(doc.id);
    return res;
}

void RagPipeline::process_chunks(const Document& doc, const RagConfig& cfg, std::size_t& committed) {
    auto parts = chunk_words(doc.content, cfg.chunk_size, cfg.chunk_overlap);
    std::vector<Chunk> batch;
    batch.reserve(std::min(parts.size(), (size_t)cfg.ingest_batch_size));
    for (size_t i = 0; i < parts.size(); ++i) {
        Chunk c;
        c.id = gen_id();
        c.document_id = doc.id;
        c.chunk_index = (int)i;
        c.content = parts[i];
        c.embedding = embedder_.embed(parts[i], cfg.embedding_model);
        c.created_at = now_rfc3339();
        batch.push_back(std::move(c));
        if ((int)batch.size() >= cfg.ingest_batch_size) {
            store_.insert_chunks_batch(batch);
            committed += batch.size();
            batch.clear();
        }
    }
    if (!batch.empty()) {
        store_.insert_chunks_batch(batch);
        committed += batch.size();
    }
}

void RagPipeline::notify_processed(const std::string& id) {
    if (!events_) return;
    try {
        events_->document_processed(id);
    } catch (const std::exception& e) {
        spdlog::error("document_processed listener failed for {}: {}", id, e.what());
    }
}

void RagPipeline::reap_finished() {
    std::lock_guard<std::mutex> lock(jobs_mtx_);
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
}

void RagPipeline::wait_idle() {
    std::vector<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(jobs_mtx_);
        jobs.swap(jobs_);
    }
    for (auto& j : jobs) {
        if (j.thread.joinable()) j.thread.join();
    }
}

RagResponse RagPipeline::query(const std::string& question, RagMode mode, const RagConfig& cfg) {
    validate_config(cfg);
    if (split_words(question).empty()) {
        throw std::invalid_argument("query must not be empty");
    }
    const auto start = Clock::now();
    RagResponse resp;
    resp.mode_used = mode;
    if (mode != RagMode::FineTunedOnly) {
        resp.retrieved_context = retriever_.retrieve(question, cfg);
    }
    resp.answer = compose_answer(question, resp.retrieved_context, mode);
    resp.elapsed_ms = elapsed_ms_since(start);
    spdlog::debug("query in mode {} used {} context item(s)", rag_mode_name(mode), resp.retrieved_context.size());
    return resp;
}

std::vector<Document> RagPipeline::list_documents() {
    return store_.list_documents();
}

bool RagPipeline::delete_document(const std::string& id) {
    bool removed = store_.delete_document(id);
    if (removed) spdlog::info("deleted document {}", id);
    return removed;
}

std::vector<DocumentMatch> RagPipeline::search_documents(const std::string& query, const RagConfig& cfg) {
    validate_config(cfg);
    return retriever_.search_documents(query, cfg);
}

ChatResponse RagPipeline::chat(const std::string& message, const RagConfig& cfg) {
    auto matches = search_documents(message, cfg);
    std::vector<std::string> refs;
    for (const auto& m : matches) refs.push_back(m.document.id);

    ChatMessage user;
    user.id = gen_id();
    user.content = message;
    user.role = "user";
    user.document_references = refs;
    user.created_at = now_rfc3339();

    ChatMessage assistant;
    assistant.id = gen_id();
    assistant.content = compose_chat_reply(matches);
    assistant.role = "assistant";
    assistant.document_references = refs;
    assistant.created_at = now_rfc3339();

    store_.insert_messages({user, assistant});
    return ChatResponse{assistant, std::move(matches)};
}

std::vector<ChatMessage> RagPipeline::chat_history() {
    return store_.list_messages();
}
