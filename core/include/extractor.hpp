#pragma once
#include <filesystem>
#include <string>

// Lower-case extension without the dot, or "unknown".
std::string infer_file_type(const std::filesystem::path& p);

// Plain text for a file of the given type. Parse failures in pdf, docx and
// csv degrade to a placeholder string; only an unreadable txt/md file throws.
std::string extract_text(const std::filesystem::path& p, const std::string& file_type);

std::string extract_pdf_text(const std::filesystem::path& p);
std::string extract_docx_text(const std::filesystem::path& p);
std::string extract_csv_text(const std::filesystem::path& p);

// Throws std::runtime_error on malformed input; extract_csv_text wraps it.
std::string csv_to_text(const std::string& data);
