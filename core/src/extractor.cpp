#include "extractor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>
#include <vector>

#if defined(RAGDESK_HAVE_POPPLER)
#include <poppler-document.h>
#include <poppler-page.h>
#endif

#if defined(RAGDESK_HAVE_DUCKX)
#include <duckx/duckx.hpp>
#endif

std::string infer_file_type(const std::filesystem::path& p) {
    auto ext = p.extension().string();
    if (ext.size() <= 1) return "unknown";
    return to_lower(ext.substr(1));
}

std::string extract_text(const std::filesystem::path& p, const std::string& file_type) {
    const std::string type = to_lower(file_type);
    if (type == "txt" || type == "md") return read_text_file(p);
    if (type == "pdf") return extract_pdf_text(p);
    if (type == "docx") return extract_docx_text(p);
    if (type == "csv") return extract_csv_text(p);
    spdlog::warn("unsupported file type '{}' for {}", type, p.string());
    return "Unsupported file type: " + type;
}

std::string extract_pdf_text(const std::filesystem::path& p) {
    static const std::string kPlaceholder = "Could not extract text from PDF";
#if defined(RAGDESK_HAVE_POPPLER)
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(p.string()));
    if (!doc) {
        spdlog::warn("poppler failed to load {}", p.string());
        return kPlaceholder;
    }
    if (doc->is_locked()) {
        spdlog::warn("skipping encrypted PDF {}", p.string());
        return kPlaceholder;
    }
    std::string text;
    const int pages = doc->pages();
    for (int i = 0; i < pages; ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) continue;
        if (i > 0) text += '\n';
        const poppler::byte_array utf8 = page->text().to_utf8();
        text.append(utf8.data(), utf8.size());
    }
    return text;
#else
    spdlog::warn("built without poppler-cpp, cannot extract {}", p.string());
    return kPlaceholder;
#endif
}

std::string extract_docx_text(const std::filesystem::path& p) {
    try {
#if defined(RAGDESK_HAVE_DUCKX)
        if (!std::filesystem::is_regular_file(p)) {
            throw std::runtime_error("no such file: " + p.string());
        }
        duckx::Document doc(p.string());
        doc.open();
        if (!doc.is_open()) {
            throw std::runtime_error("Failed to parse DOCX: " + p.string());
        }
        std::string text;
        for (auto para = doc.paragraphs(); para.has_next(); para.next()) {
            for (auto run = para.runs(); run.has_next(); run.next()) {
                text += run.get_text();
            }
            text += '\n';
        }
        return text;
#else
        throw std::runtime_error("built without DOCX support");
#endif
    } catch (const std::exception& e) {
        spdlog::warn("docx extraction failed for {}: {}", p.string(), e.what());
        return std::string("Could not extract text from DOCX: ") + e.what();
    }
}

namespace {

// RFC 4180 records; quoted fields may contain separators, doubled quotes and
// line breaks. Blank lines are skipped.
std::vector<std::vector<std::string>> parse_csv(const std::string& data) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    size_t line = 1;

    auto end_field = [&]() {
        row.push_back(std::move(field));
        field.clear();
        field_quoted = false;
    };
    auto end_row = [&]() {
        end_field();
        bool blank = row.size() == 1 && row[0].empty();
        if (!blank) rows.push_back(std::move(row));
        row.clear();
    };

    for (size_t i = 0; i < data.size(); ++i) {
        char c = data[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }
        if (c == '"' && field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
        } else if (c == ',') {
            end_field();
        } else if (c == '\r') {
            // CRLF handled by the following '\n'
        } else if (c == '\n') {
            end_row();
            ++line;
        } else {
            field += c;
        }
    }
    if (in_quotes) {
        throw std::runtime_error("unterminated quoted field starting before line " + std::to_string(line));
    }
    if (!field.empty() || field_quoted || !row.empty()) end_row();
    return rows;
}

} // namespace

std::string csv_to_text(const std::string& data) {
    auto rows = parse_csv(data);
    std::string text;
    if (rows.empty()) return text;
    const size_t width = rows.front().size();
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != width) {
            throw std::runtime_error("record " + std::to_string(r + 1) + " has " +
                                     std::to_string(rows[r].size()) + " fields, expected " +
                                     std::to_string(width));
        }
        text += join(rows[r], " | ");
        text += '\n';
    }
    return text;
}

std::string extract_csv_text(const std::filesystem::path& p) {
    try {
        return csv_to_text(read_text_file(p));
    } catch (const std::exception& e) {
        spdlog::warn("csv extraction failed for {}: {}", p.string(), e.what());
        return std::string("Could not extract text from CSV: ") + e.what();
    }
}
