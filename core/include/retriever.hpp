#pragma once
#include "config.hpp"
#include "embeddings.hpp"
#include "store.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Exhaustive cosine ranking over every stored chunk. The query is embedded
// with the configured backend; chunks embedded with a different
// dimensionality are skipped.
class Retriever {
public:
    Retriever(RagStore& store, const Embedder& embedder);

    // At most top_k results, each scoring above similarity_threshold, best
    // first. Throws std::invalid_argument for an empty query.
    std::vector<RetrievalResult> retrieve(const std::string& query, const RagConfig& cfg) const;

    // Matches grouped per document, ranked by each document's best chunk.
    std::vector<DocumentMatch> search_documents(const std::string& query, const RagConfig& cfg,
                                                std::size_t limit = 10) const;

private:
    std::vector<float> embed_query(const std::string& query, const RagConfig& cfg) const;

    RagStore& store_;
    const Embedder& embedder_;
};
