#pragma once
#include "config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct Document {
    std::string id;
    std::string title;
    std::string content;
    std::optional<std::string> file_path;
    std::string file_type;
    std::string content_hash;
    std::string created_at;
    std::string updated_at;
};

struct Chunk {
    std::string id;
    std::string document_id;
    int chunk_index{0};
    std::string content;
    std::vector<float> embedding;
    std::string created_at;
};

// One row of the chunk/document join streamed during a full scan.
struct ScannedChunk {
    std::string chunk_id;
    std::string document_id;
    int chunk_index{0};
    std::string content;
    std::vector<float> embedding;
    std::string document_title;
    std::optional<std::string> file_path;
};

struct RetrievalResult {
    std::string chunk_id;
    std::string content;
    std::string document_title;
    float similarity_score{0.0f};
    std::string source_info; // file path or "unknown"
};

struct DocumentMatch {
    Document document;
    std::vector<std::string> relevant_chunks;
    float similarity_score{0.0f};
};

struct ChatMessage {
    std::string id;
    std::string content;
    std::string role; // "user" | "assistant"
    std::vector<std::string> document_references;
    std::string created_at;
};

struct IngestResult {
    bool success{false};
    std::string message;
    std::size_t chunks_created{0};
    std::uint64_t elapsed_ms{0};
    Document document;
};

struct RagResponse {
    std::string answer;
    std::vector<RetrievalResult> retrieved_context;
    RagMode mode_used{RagMode::BaseWithRAG};
    std::uint64_t elapsed_ms{0};
};

struct ChatResponse {
    ChatMessage message;
    std::vector<DocumentMatch> sources;
};
