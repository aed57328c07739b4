#pragma once
#include "config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Placeholder answer text for each mode. No model is called; only the
// selection and layout of context is meaningful.
std::string compose_answer(const std::string& query, const std::vector<RetrievalResult>& context, RagMode mode);

std::string compose_chat_reply(const std::vector<DocumentMatch>& matches);
