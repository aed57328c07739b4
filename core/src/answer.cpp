#include "answer.hpp"
#include "util.hpp"

std::string compose_answer(const std::string& query, const std::vector<RetrievalResult>& context, RagMode mode) {
    switch (mode) {
        case RagMode::FineTunedOnly:
            return "Fine-tuned model response to: " + query +
                   "\n\n[This would be the output from your fine-tuned model]";

        case RagMode::FineTunedWithRAG: {
            if (context.empty()) {
                return "Fine-tuned model response (no relevant context found): " + query;
            }
            std::vector<std::string> blocks;
            for (const auto& r : context) blocks.push_back("From " + r.document_title + ": " + r.content);
            return "Fine-tuned model response based on context:\n\nQuery: " + query +
                   "\n\nRelevant context:\n" + join(blocks, "\n\n") +
                   "\n\n[This would be the enhanced fine-tuned model response using the retrieved context]";
        }

        case RagMode::BaseWithRAG:
            break;
    }

    if (context.empty()) {
        return "I don't have relevant information to answer: " + query +
               "\n\nPlease upload relevant documents to help me provide a better response.";
    }
    std::vector<std::string> contents, titles;
    for (const auto& r : context) {
        contents.push_back(r.content);
        titles.push_back(r.document_title);
    }
    return "Based on the documents in your knowledge base:\n\nQuery: " + query +
           "\n\nAnswer: Based on the retrieved information, here's what I found:\n\n" + join(contents, "\n\n") +
           "\n\nSources: " + join(titles, ", ");
}

std::string compose_chat_reply(const std::vector<DocumentMatch>& matches) {
    std::vector<std::string> chunks;
    for (const auto& m : matches) {
        chunks.insert(chunks.end(), m.relevant_chunks.begin(), m.relevant_chunks.end());
    }
    if (chunks.empty()) {
        return "I don't have any relevant documents to answer your question. Please upload some documents first.";
    }
    return "Based on the uploaded documents, here's what I found:\n\n" + join(chunks, "\n\n") +
           "\n\nThis information comes from " + std::to_string(matches.size()) +
           " document(s) in your knowledge base.";
}
