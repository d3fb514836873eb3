/**
 * @file Chunker.cpp
 * @brief Implementation of the Chunker.
 */

#include "application/Chunker.hpp"
#include "application/Utf8.hpp"
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <string>

namespace archmend::application {

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n\f") == std::string::npos;
}

/** Brace depth at the start of every line, ignoring comments and literals. */
std::vector<int> DepthBeforeLines(const std::vector<std::string>& lines) {
    std::vector<int> depth(lines.size(), 0);
    int d = 0;
    bool inBlockComment = false;

    for (size_t idx = 0; idx < lines.size(); ++idx) {
        depth[idx] = d;
        const std::string& line = lines[idx];
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            char next = i + 1 < line.size() ? line[i + 1] : '\0';
            if (inBlockComment) {
                if (c == '*' && next == '/') {
                    inBlockComment = false;
                    ++i;
                }
                continue;
            }
            if (c == '/' && next == '/') break;
            if (c == '/' && next == '*') {
                inBlockComment = true;
                ++i;
                continue;
            }
            if (c == '"' || c == '\'') {
                for (++i; i < line.size() && line[i] != c; ++i) {
                    if (line[i] == '\\') ++i;
                }
                continue;
            }
            if (c == '{') ++d;
            if (c == '}') d = std::max(0, d - 1);
        }
    }
    return depth;
}

const std::regex& HeaderPattern() {
    static const std::regex re(R"(^\s*(package|import)\s+[\w.*\s]+;)");
    return re;
}

const std::regex& DeclarationPattern() {
    static const std::regex re(
        R"(^\s*(?:@\w+(?:\([^)]*\))?\s+)*(?:(?:public|protected|private|abstract|final|static|sealed|non-sealed|strictfp)\s+)*(?:class|interface|enum|record|@interface)\s+\w+)");
    return re;
}

const std::regex& MemberPattern() {
    static const std::regex re(
        R"(^\s*(?:@\w+(?:\([^)]*\))?\s+)*(?:(?:public|protected|private|static|final|abstract|synchronized|native|default)\s+)*(?:<[^>]*>\s+)?(?:[\w.$]+(?:<[^()]*>)?(?:\[\])*\s+)?\w+\s*\()");
    return re;
}

const std::regex& StatementKeywordPattern() {
    static const std::regex re(R"(^\s*(?:new|return|throw|if|for|while|switch|else|case|do|try|catch)\b)");
    return re;
}

} // namespace

ChunkMode Chunker::ModeFor(domain::ContentType type) {
    switch (type) {
        case domain::ContentType::Java: return ChunkMode::StructureAware;
        case domain::ContentType::Markdown:
        case domain::ContentType::PlainText: return ChunkMode::ParagraphWindow;
        case domain::ContentType::Unknown: return ChunkMode::LineWindow;
    }
    return ChunkMode::LineWindow;
}

std::vector<domain::Chunk> Chunker::split(const domain::SourceUnit& unit, int maxSize, int overlap, ChunkMode mode) const {
    if (maxSize < 1 || overlap < 0 || maxSize <= overlap) {
        throw std::invalid_argument("Invalid chunking parameters: maxSize=" + std::to_string(maxSize) +
                                    ", overlap=" + std::to_string(overlap) + " (maxSize must exceed overlap)");
    }
    if (unit.text.empty()) {
        return {};
    }

    if (mode == ChunkMode::ParagraphWindow) {
        return paragraphChunks(unit, static_cast<size_t>(maxSize), static_cast<size_t>(overlap));
    }

    std::vector<std::string> lines = SplitLines(unit.text);
    std::vector<LineRange> ranges;
    if (mode == ChunkMode::StructureAware) {
        ranges = structureRanges(lines, static_cast<size_t>(maxSize));
    }
    if (ranges.empty()) {
        size_t windowOverlap = mode == ChunkMode::StructureAware ? 0 : static_cast<size_t>(overlap);
        ranges = lineWindows(0, lines.size(), static_cast<size_t>(maxSize), windowOverlap, "window");
    }

    std::vector<domain::Chunk> chunks;
    for (const auto& range : ranges) {
        std::string text;
        for (size_t i = range.begin; i < range.end; ++i) {
            if (i > range.begin) text += "\n";
            text += lines[i];
        }
        if (IsBlank(text)) continue;

        domain::Chunk chunk;
        chunk.unitId = unit.id;
        chunk.index = static_cast<int>(chunks.size()) + 1;
        chunk.text = std::move(text);
        chunk.label = range.label;
        chunk.firstLine = static_cast<int>(range.begin) + 1;
        chunk.lastLine = static_cast<int>(range.end);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<Chunker::LineRange> Chunker::lineWindows(size_t begin, size_t end, size_t maxSize, size_t overlap, const char* label) {
    std::vector<LineRange> ranges;
    size_t step = maxSize - overlap;
    for (size_t start = begin; start < end; start += step) {
        size_t stop = std::min(start + maxSize, end);
        ranges.push_back({start, stop, label});
        if (stop == end) break;
    }
    return ranges;
}

std::vector<Chunker::LineRange> Chunker::structureRanges(const std::vector<std::string>& lines, size_t maxSize) {
    std::vector<int> depth = DepthBeforeLines(lines);
    const size_t n = lines.size();

    size_t headerEnd = 0;
    std::vector<size_t> declStarts;
    for (size_t i = 0; i < n; ++i) {
        if (depth[i] != 0) continue;
        if (std::regex_search(lines[i], DeclarationPattern())) {
            declStarts.push_back(i);
        } else if (declStarts.empty() && std::regex_search(lines[i], HeaderPattern())) {
            headerEnd = i + 1;
        }
    }

    std::vector<LineRange> ranges;
    if (declStarts.empty()) {
        if (headerEnd == 0) return ranges;
        ranges.push_back({0, headerEnd, "header"});
        auto rest = lineWindows(headerEnd, n, maxSize, 0, "window");
        ranges.insert(ranges.end(), rest.begin(), rest.end());
        return ranges;
    }

    if (headerEnd > 0) {
        ranges.push_back({0, headerEnd, "header"});
    }

    auto addPiece = [&](size_t begin, size_t end, const char* label) {
        if (begin >= end) return;
        if (end - begin <= maxSize) {
            ranges.push_back({begin, end, label});
        } else {
            auto windows = lineWindows(begin, end, maxSize, 0, "window");
            ranges.insert(ranges.end(), windows.begin(), windows.end());
        }
    };

    for (size_t d = 0; d < declStarts.size(); ++d) {
        size_t begin = d == 0 ? headerEnd : declStarts[d];
        size_t end = d + 1 < declStarts.size() ? declStarts[d + 1] : n;

        if (end - begin <= maxSize) {
            ranges.push_back({begin, end, "type-body"});
            continue;
        }

        std::vector<size_t> memberStarts;
        for (size_t i = declStarts[d] + 1; i < end; ++i) {
            if (depth[i] != 1) continue;
            if (std::regex_search(lines[i], StatementKeywordPattern())) continue;
            if (!std::regex_search(lines[i], MemberPattern())) continue;

            size_t start = i;
            while (start > declStarts[d] + 1 && depth[start - 1] == 1 && Trim(lines[start - 1]).rfind("@", 0) == 0) {
                --start;
            }
            if (memberStarts.empty() || start > memberStarts.back()) {
                memberStarts.push_back(start);
            }
        }

        if (memberStarts.empty()) {
            addPiece(begin, end, "window");
            continue;
        }

        addPiece(begin, memberStarts.front(), "type-header");
        for (size_t m = 0; m < memberStarts.size(); ++m) {
            size_t stop = m + 1 < memberStarts.size() ? memberStarts[m + 1] : end;
            addPiece(memberStarts[m], stop, "member");
        }
    }
    return ranges;
}

std::vector<domain::Chunk> Chunker::paragraphChunks(const domain::SourceUnit& unit, size_t maxSize, size_t overlap) {
    static const std::regex separator(R"(\n\s*\n)");

    std::vector<std::string> paragraphs;
    std::sregex_token_iterator it(unit.text.begin(), unit.text.end(), separator, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        std::string paragraph = Trim(it->str());
        if (!paragraph.empty()) paragraphs.push_back(std::move(paragraph));
    }

    std::vector<domain::Chunk> chunks;
    auto emit = [&](const std::string& text) {
        domain::Chunk chunk;
        chunk.unitId = unit.id;
        chunk.index = static_cast<int>(chunks.size()) + 1;
        chunk.text = text;
        chunk.label = "paragraph";
        chunks.push_back(std::move(chunk));
    };

    std::string current;
    for (const auto& paragraph : paragraphs) {
        if (!current.empty() && current.size() + 2 + paragraph.size() > maxSize) {
            emit(current);
            std::string seed = (overlap > 0 && current.size() > overlap) ? Utf8Suffix(current, overlap) : "";
            current = seed.empty() ? paragraph : seed + "\n\n" + paragraph;
        } else {
            current = current.empty() ? paragraph : current + "\n\n" + paragraph;
        }
    }
    if (!current.empty()) {
        emit(current);
    }
    return chunks;
}

} // namespace archmend::application
