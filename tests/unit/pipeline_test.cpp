#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "pipeline.hpp"
#include "test_support.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>
#include <mutex>
#include <stdexcept>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;
using testing_support::numbered_words;
using testing_support::write_file;

namespace {

struct RecordingEvents : PipelineEvents {
    void document_processed(const std::string& document_id) override {
        std::lock_guard<std::mutex> lock(mtx);
        processed.push_back(document_id);
    }
    std::vector<std::string> seen() {
        std::lock_guard<std::mutex> lock(mtx);
        return processed;
    }
    std::mutex mtx;
    std::vector<std::string> processed;
};

struct ThrowingEvents : PipelineEvents {
    void document_processed(const std::string&) override { throw std::runtime_error("listener down"); }
};

struct PipelineFixture {
    testing_support::TempDb db;
    RagStore store{db.path.string()};
    Embedder embedder;
    RecordingEvents events;
    RagPipeline pipeline{store, embedder, &events};
    RagConfig cfg;
};

} // namespace

TEST_CASE("RagPipeline: 450-word document becomes three chunks", "[unit][pipeline][ingest]") {
    PipelineFixture fix;
    auto path = write_file("pipeline_", ".txt", numbered_words(450));

    auto result = fix.pipeline.ingest(path, std::string("Numbers"), fix.cfg);
    REQUIRE(result.success);
    CHECK(result.chunks_created == 3);
    CHECK(result.message == "Successfully processed document: Numbers");
    CHECK(result.document.title == "Numbers");
    CHECK(result.document.file_type == "txt");
    CHECK(result.document.content_hash == sha256_hex(numbered_words(450)));

    auto chunks = fix.store.list_chunks(result.document.id);
    REQUIRE(chunks.size() == 3);
    for (int i = 0; i < 3; ++i) {
        CHECK(chunks[i].chunk_index == i);
        CHECK(chunks[i].embedding.size() == (size_t)kDeterministicEmbeddingDims);
    }
    CHECK_THAT(chunks[1].content, StartsWith("w150 w151"));

    auto docs = fix.pipeline.list_documents();
    REQUIRE(docs.size() == 1);
    CHECK(docs[0].id == result.document.id);
    CHECK(docs[0].file_path == std::optional<std::string>(path.string()));
}

TEST_CASE("RagPipeline: title defaults to the file name", "[unit][pipeline][ingest]") {
    PipelineFixture fix;
    auto path = write_file("named_", ".md", "# heading\nbody text");
    auto result = fix.pipeline.ingest(path, std::nullopt, fix.cfg);
    REQUIRE(result.success);
    CHECK(result.document.title == path.filename().string());
    CHECK(result.document.file_type == "md");
    CHECK(result.chunks_created == 1);
}

TEST_CASE("RagPipeline: empty file stores a document without chunks", "[unit][pipeline][ingest]") {
    PipelineFixture fix;
    auto path = write_file("empty_", ".txt", "   \n ");
    auto result = fix.pipeline.ingest(path, std::string("Blank"), fix.cfg);
    CHECK(result.success);
    CHECK(result.chunks_created == 0);
    CHECK(fix.pipeline.list_documents().size() == 1);
}

TEST_CASE("RagPipeline: missing file and bad config are rejected up front", "[unit][pipeline][ingest]") {
    PipelineFixture fix;
    CHECK_THROWS_AS(fix.pipeline.ingest(testing_support::temp_path("absent_", ".txt"), std::nullopt, fix.cfg),
                    std::runtime_error);

    auto path = write_file("cfg_", ".txt", "some words");
    fix.cfg.chunk_overlap = fix.cfg.chunk_size;
    CHECK_THROWS_AS(fix.pipeline.ingest(path, std::nullopt, fix.cfg), std::invalid_argument);
    CHECK(fix.pipeline.list_documents().empty());
}

TEST_CASE("RagPipeline: unsupported file keeps the placeholder text", "[unit][pipeline][ingest]") {
    PipelineFixture fix;
    auto path = write_file("odd_", ".bin", "\x01\x02");
    auto result = fix.pipeline.ingest(path, std::nullopt, fix.cfg);
    REQUIRE(result.success);
    CHECK(result.document.content == "Unsupported file type: bin");
    CHECK(result.chunks_created == 1);
}

TEST_CASE("RagPipeline: embedding failure reports committed chunks", "[unit][pipeline][ingest]") {
    testing_support::TempDb db;
    RagStore store(db.path.string());
    testing_support::FakeEmbeddingEndpoint endpoint;
    endpoint.status = 500;
    Embedder embedder(endpoint.transport());
    RecordingEvents events;
    RagPipeline pipeline(store, embedder, &events);

    RagConfig cfg;
    ExternalApiModel api;
    api.api_key = "k";
    cfg.embedding_model = api;

    auto path = write_file("fail_", ".txt", "one two three");
    auto result = pipeline.ingest(path, std::string("Doomed"), cfg);
    CHECK_FALSE(result.success);
    CHECK(result.chunks_created == 0);
    CHECK_THAT(result.message, StartsWith("Error processing chunks for Doomed: "));
    CHECK_THAT(result.message, ContainsSubstring("status 500"));

    // the document row stays, and the listener still hears about it
    CHECK(pipeline.list_documents().size() == 1);
    CHECK(events.seen() == std::vector<std::string>{result.document.id});
}

TEST_CASE("RagPipeline: async ingest notifies once chunks are committed", "[unit][pipeline][async]") {
    PipelineFixture fix;
    fix.cfg.ingest_batch_size = 2;
    auto a = write_file("async_", ".txt", numbered_words(700));
    auto b = write_file("async_", ".txt", numbered_words(30));

    auto ta = fix.pipeline.ingest_async(a, std::string("A"), fix.cfg);
    auto tb = fix.pipeline.ingest_async(b, std::string("B"), fix.cfg);
    CHECK_FALSE(ta.duplicate);
    CHECK(fix.store.get_document(ta.document.id).has_value());

    auto ra = ta.result.get();
    auto rb = tb.result.get();
    CHECK(ra.success);
    CHECK(rb.success);
    CHECK(ra.chunks_created == 5);
    CHECK(rb.chunks_created == 1);
    CHECK(fix.store.count_chunks(ta.document.id) == 5);

    // five chunks over three batches stay contiguous and in document order
    auto chunks = fix.store.list_chunks(ta.document.id);
    REQUIRE(chunks.size() == 5);
    const size_t overlap = (size_t)fix.cfg.chunk_overlap;
    for (size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].chunk_index == (int)i);
        auto words = split_words(chunks[i].content);
        CHECK(words.front() == "w" + std::to_string(150 * i));
        if (i == 0) continue;
        auto prev = split_words(chunks[i - 1].content);
        std::vector<std::string> tail(prev.end() - overlap, prev.end());
        std::vector<std::string> head(words.begin(), words.begin() + overlap);
        CHECK(tail == head);
        CHECK(std::find(prev.begin(), prev.end(), words[overlap]) == prev.end());
    }

    fix.pipeline.wait_idle();
    auto seen = fix.events.seen();
    REQUIRE(seen.size() == 2);
    CHECK(std::find(seen.begin(), seen.end(), ta.document.id) != seen.end());
    CHECK(std::find(seen.begin(), seen.end(), tb.document.id) != seen.end());
}

TEST_CASE("RagPipeline: failing listener does not fail ingestion", "[unit][pipeline][async]") {
    testing_support::TempDb db;
    RagStore store(db.path.string());
    Embedder embedder;
    ThrowingEvents events;
    RagPipeline pipeline(store, embedder, &events);

    auto path = write_file("listener_", ".txt", "hello there");
    auto result = pipeline.ingest(path, std::nullopt, RagConfig{});
    CHECK(result.success);
    CHECK(result.chunks_created == 1);
}

TEST_CASE("RagPipeline: duplicate policy", "[unit][pipeline][duplicates]") {
    PipelineFixture fix;
    auto path = write_file("dup_", ".txt", numbered_words(20));

    SECTION("allow creates a second document") {
        auto first = fix.pipeline.ingest(path, std::nullopt, fix.cfg);
        auto second = fix.pipeline.ingest(path, std::nullopt, fix.cfg);
        CHECK(first.document.id != second.document.id);
        CHECK(fix.pipeline.list_documents().size() == 2);
    }
    SECTION("skip reuses the existing document") {
        fix.cfg.duplicate_policy = DuplicatePolicy::Skip;
        auto first = fix.pipeline.ingest(path, std::nullopt, fix.cfg);
        auto ticket = fix.pipeline.ingest_async(path, std::string("again"), fix.cfg);
        CHECK(ticket.duplicate);
        CHECK(ticket.document.id == first.document.id);
        auto second = ticket.result.get();
        CHECK(second.success);
        CHECK(second.chunks_created == 0);
        CHECK(fix.pipeline.list_documents().size() == 1);
        CHECK(fix.store.count_chunks(first.document.id) == 1);
        auto stored = fix.store.get_document(first.document.id);
        REQUIRE(stored.has_value());
        CHECK(stored->updated_at >= first.document.updated_at);
    }
}

TEST_CASE("RagPipeline: query modes", "[unit][pipeline][query]") {
    PipelineFixture fix;
    auto path = write_file("query_", ".txt", numbered_words(450));
    auto ingested = fix.pipeline.ingest(path, std::string("Numbers"), fix.cfg);
    REQUIRE(ingested.success);
    auto chunks = fix.store.list_chunks(ingested.document.id);
    REQUIRE(chunks.size() == 3);
    const std::string question = chunks[1].content;

    SECTION("base model with retrieval finds the matching chunk") {
        auto resp = fix.pipeline.query(question, RagMode::BaseWithRAG, fix.cfg);
        CHECK(resp.mode_used == RagMode::BaseWithRAG);
        REQUIRE_FALSE(resp.retrieved_context.empty());
        CHECK(resp.retrieved_context.size() <= 5);
        CHECK(resp.retrieved_context[0].chunk_id == chunks[1].id);
        CHECK_THAT(resp.retrieved_context[0].similarity_score, WithinAbs(1.0, 1e-5));
        CHECK(resp.retrieved_context[0].source_info == path.string());
        CHECK_THAT(resp.answer, StartsWith("Based on the documents in your knowledge base:"));
        CHECK_THAT(resp.answer, ContainsSubstring("Sources: Numbers"));
    }
    SECTION("fine-tuned with retrieval lists context per document") {
        auto resp = fix.pipeline.query(question, RagMode::FineTunedWithRAG, fix.cfg);
        REQUIRE_FALSE(resp.retrieved_context.empty());
        CHECK_THAT(resp.answer, ContainsSubstring("From Numbers: " + question));
    }
    SECTION("fine-tuned only retrieves nothing") {
        auto resp = fix.pipeline.query(question, RagMode::FineTunedOnly, fix.cfg);
        CHECK(resp.retrieved_context.empty());
        CHECK_THAT(resp.answer, StartsWith("Fine-tuned model response to: "));
    }
    SECTION("empty question is rejected") {
        CHECK_THROWS_AS(fix.pipeline.query("  ", RagMode::BaseWithRAG, fix.cfg), std::invalid_argument);
    }
}

TEST_CASE("RagPipeline: fine-tuned only never embeds the query", "[unit][pipeline][query]") {
    testing_support::TempDb db;
    RagStore store(db.path.string());
    testing_support::FakeEmbeddingEndpoint endpoint;
    Embedder embedder(endpoint.transport());
    RagPipeline pipeline(store, embedder);

    RagConfig cfg;
    ExternalApiModel api;
    api.api_key = "k";
    cfg.embedding_model = api;

    auto resp = pipeline.query("anything", RagMode::FineTunedOnly, cfg);
    CHECK(endpoint.calls->load() == 0);
    CHECK(resp.answer == "Fine-tuned model response to: anything\n\n"
                         "[This would be the output from your fine-tuned model]");

    pipeline.query("anything", RagMode::BaseWithRAG, cfg);
    CHECK(endpoint.calls->load() == 1);
}

TEST_CASE("RagPipeline: empty corpus answers without context", "[unit][pipeline][query]") {
    PipelineFixture fix;
    auto resp = fix.pipeline.query("What is RAG?", RagMode::BaseWithRAG, fix.cfg);
    CHECK(resp.retrieved_context.empty());
    CHECK(resp.answer == "I don't have relevant information to answer: What is RAG?\n\n"
                         "Please upload relevant documents to help me provide a better response.");
}

TEST_CASE("RagPipeline: delete removes the document from retrieval", "[unit][pipeline][delete]") {
    PipelineFixture fix;
    auto path = write_file("delete_", ".txt", "delete me please");
    auto result = fix.pipeline.ingest(path, std::nullopt, fix.cfg);
    REQUIRE(result.success);

    CHECK_FALSE(fix.pipeline.query("delete me please", RagMode::BaseWithRAG, fix.cfg).retrieved_context.empty());
    CHECK(fix.pipeline.delete_document(result.document.id));
    CHECK_FALSE(fix.pipeline.delete_document(result.document.id));
    CHECK(fix.pipeline.list_documents().empty());
    CHECK(fix.store.count_chunks(result.document.id) == 0);
    CHECK(fix.pipeline.query("delete me please", RagMode::BaseWithRAG, fix.cfg).retrieved_context.empty());
}

TEST_CASE("RagPipeline: search and chat", "[unit][pipeline][chat]") {
    PipelineFixture fix;
    auto path = write_file("chat_", ".txt", "solar panels convert sunlight into electricity");
    auto result = fix.pipeline.ingest(path, std::string("Solar"), fix.cfg);
    REQUIRE(result.success);

    auto matches = fix.pipeline.search_documents("solar panels convert sunlight into electricity", fix.cfg);
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].document.id == result.document.id);

    auto reply = fix.pipeline.chat("solar panels convert sunlight into electricity", fix.cfg);
    CHECK(reply.message.role == "assistant");
    CHECK_THAT(reply.message.content, StartsWith("Based on the uploaded documents, here's what I found:"));
    CHECK_THAT(reply.message.content, ContainsSubstring("1 document(s)"));
    REQUIRE(reply.sources.size() == 1);
    CHECK(reply.message.document_references == std::vector<std::string>{result.document.id});

    auto history = fix.pipeline.chat_history();
    REQUIRE(history.size() == 2);
    CHECK(history[0].role == "user");
    CHECK(history[0].content == "solar panels convert sunlight into electricity");
    CHECK(history[1].role == "assistant");
    CHECK(history[1].id == reply.message.id);
}

TEST_CASE("RagPipeline: chat without documents", "[unit][pipeline][chat]") {
    PipelineFixture fix;
    auto reply = fix.pipeline.chat("hello?", fix.cfg);
    CHECK(reply.sources.empty());
    CHECK(reply.message.content ==
          "I don't have any relevant documents to answer your question. Please upload some documents first.");
    CHECK(fix.pipeline.chat_history().size() == 2);
}

TEST_CASE("RagPipeline: batch size larger than the document", "[unit][pipeline][ingest]") {
    PipelineFixture fix;
    fix.cfg.ingest_batch_size = std::numeric_limits<int>::max();
    auto path = write_file("batch_", ".txt", numbered_words(450));
    auto result = fix.pipeline.ingest(path, std::nullopt, fix.cfg);
    CHECK(result.success);
    CHECK(result.chunks_created == 3);
    CHECK(fix.store.count_chunks(result.document.id) == 3);
}

TEST_CASE("RagPipeline: Latin-1 text ingests through the external backend", "[unit][pipeline][ingest]") {
    testing_support::TempDb db;
    RagStore store(db.path.string());
    testing_support::FakeEmbeddingEndpoint endpoint;
    Embedder embedder(endpoint.transport());
    RagPipeline pipeline(store, embedder);

    RagConfig cfg;
    ExternalApiModel api;
    api.api_key = "k";
    cfg.embedding_model = api;

    auto path = write_file("latin1_", ".txt", "caf\xe9 cr\xe8me br\xfbl\xe9" "e");
    auto result = pipeline.ingest(path, std::nullopt, cfg);
    CHECK(result.success);
    CHECK(result.chunks_created == 1);
    CHECK(endpoint.calls->load() == 1);
}
