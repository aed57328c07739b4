#include "retriever.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

Retriever::Retriever(RagStore& store, const Embedder& embedder) : store_(store), embedder_(embedder) {}

std::vector<float> Retriever::embed_query(const std::string& query, const RagConfig& cfg) const {
    if (split_words(query).empty()) {
        throw std::invalid_argument("query must not be empty");
    }
    return embedder_.embed(query, cfg.embedding_model);
}

std::vector<RetrievalResult> Retriever::retrieve(const std::string& query, const RagConfig& cfg) const {
    auto qvec = embed_query(query, cfg);

    std::vector<RetrievalResult> out;
    size_t scanned = 0, skipped = 0;
    store_.for_each_chunk([&](const ScannedChunk& c) {
        ++scanned;
        if (c.embedding.size() != qvec.size()) {
            ++skipped;
            return;
        }
        float score = cosine_similarity(qvec, c.embedding);
        if (score > cfg.similarity_threshold) {
            out.push_back({c.chunk_id, c.content, c.document_title, score, c.file_path.value_or("unknown")});
        }
    });
    std::stable_sort(out.begin(), out.end(),
                     [](const RetrievalResult& a, const RetrievalResult& b){ return a.similarity_score > b.similarity_score; });
    if (out.size() > (size_t)std::max(cfg.top_k, 0)) out.resize((size_t)std::max(cfg.top_k, 0));

    spdlog::debug("retrieval scanned {} chunks ({} of another dimension), kept {}", scanned, skipped, out.size());
    return out;
}

std::vector<DocumentMatch> Retriever::search_documents(const std::string& query, const RagConfig& cfg,
                                                       std::size_t limit) const {
    auto qvec = embed_query(query, cfg);

    struct Hit {
        std::vector<std::string> chunks;
        float best{0.0f};
    };
    std::vector<std::string> order;
    std::unordered_map<std::string, Hit> hits;
    store_.for_each_chunk([&](const ScannedChunk& c) {
        if (c.embedding.size() != qvec.size()) return;
        float score = cosine_similarity(qvec, c.embedding);
        if (score <= cfg.similarity_threshold) return;
        auto it = hits.find(c.document_id);
        if (it == hits.end()) {
            order.push_back(c.document_id);
            hits.emplace(c.document_id, Hit{{c.content}, score});
        } else {
            it->second.chunks.push_back(c.content);
            it->second.best = std::max(it->second.best, score);
        }
    });

    std::vector<DocumentMatch> out;
    for (const auto& id : order) {
        auto doc = store_.get_document(id);
        if (!doc) continue; // deleted since the scan
        auto& hit = hits[id];
        out.push_back({std::move(*doc), std::move(hit.chunks), hit.best});
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const DocumentMatch& a, const DocumentMatch& b){ return a.similarity_score > b.similarity_score; });
    if (out.size() > limit) out.resize(limit);
    return out;
}
