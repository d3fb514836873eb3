/**
 * @file StructuralMerger.cpp
 * @brief Implementation of the StructuralMerger degradation chain.
 */

#include "application/StructuralMerger.hpp"
#include "application/Annotation.hpp"
#include "application/ResultAggregator.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <sstream>

namespace archmend::application {

namespace {

const char* const kPartialHeader = "Un-merged snippet blocks:";
const char* const kBlockSeparator = "\n\n//--- Chunk parse fail ---\n";
const char* const kUnmergedHeader = "Entire snippet could not be merged after chunk attempts:";
const char* const kFailedHeader = "Snippet (entire) unparseable due to original parse fail:";

struct TextEdit {
    size_t begin;
    size_t end;
    std::string replacement;
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool IsIdentifier(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isalnum(c) || c == '_' || c == '$'; });
}

/** Identifier as a regex literal; '$' is the only metacharacter it can hold. */
std::string IdentifierPattern(const std::string& identifier) {
    std::string out;
    for (char c : identifier) {
        if (c == '$') out += '\\';
        out += c;
    }
    return out;
}

/** Marks every byte that belongs to a comment or a literal. */
std::vector<bool> CodeMask(const std::string& text) {
    std::vector<bool> mask(text.size(), false);
    size_t i = 0;
    auto markUntil = [&](size_t from, size_t to) {
        for (size_t k = from; k < to && k < text.size(); ++k) mask[k] = true;
    };

    while (i < text.size()) {
        char c = text[i];
        char next = i + 1 < text.size() ? text[i + 1] : '\0';
        if (c == '/' && next == '/') {
            size_t end = text.find('\n', i);
            if (end == std::string::npos) end = text.size();
            markUntil(i, end);
            i = end;
        } else if (c == '/' && next == '*') {
            size_t end = text.find("*/", i + 2);
            end = end == std::string::npos ? text.size() : end + 2;
            markUntil(i, end);
            i = end;
        } else if (text.compare(i, 3, "\"\"\"") == 0) {
            size_t end = text.find("\"\"\"", i + 3);
            end = end == std::string::npos ? text.size() : end + 3;
            markUntil(i, end);
            i = end;
        } else if (c == '"' || c == '\'') {
            size_t k = i + 1;
            while (k < text.size() && text[k] != c && text[k] != '\n') {
                if (text[k] == '\\') ++k;
                ++k;
            }
            size_t end = std::min(k + 1, text.size());
            markUntil(i, end);
            i = end;
        } else {
            ++i;
        }
    }
    return mask;
}

/** Position of the delimiter closing the one at pos, or npos. */
size_t MatchClosing(const std::string& text, const std::vector<bool>& mask, size_t pos, char open, char close) {
    int depth = 0;
    for (size_t i = pos; i < text.size(); ++i) {
        if (mask[i]) continue;
        if (text[i] == open) ++depth;
        if (text[i] == close && --depth == 0) return i;
    }
    return std::string::npos;
}

/** One past the ';' ending the statement starting at pos, or npos. */
size_t StatementEnd(const std::string& text, const std::vector<bool>& mask, size_t pos) {
    int depth = 0;
    for (size_t i = pos; i < text.size(); ++i) {
        if (mask[i]) continue;
        char c = text[i];
        if (c == '(' || c == '{' || c == '[') ++depth;
        if (c == ')' || c == '}' || c == ']') {
            if (--depth < 0) return std::string::npos;
        }
        if (c == ';' && depth == 0) return i + 1;
    }
    return std::string::npos;
}

size_t SkipWhitespace(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    return pos;
}

bool StartsWithWord(const std::string& text, size_t pos, const std::string& word) {
    if (text.compare(pos, word.size(), word) != 0) return false;
    size_t after = pos + word.size();
    return after >= text.size() || !(std::isalnum(static_cast<unsigned char>(text[after])) || text[after] == '_');
}

bool EndsWithWord(const std::string& text, size_t pos, const std::string& word) {
    size_t k = pos;
    while (k > 0 && std::isspace(static_cast<unsigned char>(text[k - 1]))) --k;
    if (k < word.size() || text.compare(k - word.size(), word.size(), word) != 0) return false;
    size_t before = k - word.size();
    return before == 0 || !(std::isalnum(static_cast<unsigned char>(text[before - 1])) || text[before - 1] == '_');
}

/** Applies non-overlapping edits sorted by begin; keeps code after a removed span on its own line. */
std::string ApplyEdits(const std::string& text, const std::vector<TextEdit>& edits) {
    std::string out = text;
    for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
        std::string replacement = it->replacement;
        size_t lineEnd = out.find('\n', it->end);
        std::string rest = out.substr(it->end, lineEnd == std::string::npos ? std::string::npos : lineEnd - it->end);
        if (!IsBlank(rest)) replacement += "\n";
        out.replace(it->begin, it->end - it->begin, replacement);
    }
    return out;
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::string WithAnnotation(std::string text, const std::string& header, const std::string& body) {
    if (!text.empty() && text.back() != '\n') text += "\n";
    return text + "\n" + BlockAnnotation(header, body);
}

} // namespace

StructuralMerger::StructuralMerger(std::shared_ptr<const domain::StructuralParser> parser, MergeStrategy strategy)
    : m_parser(std::move(parser)), m_strategy(std::move(strategy)) {}

domain::MergeResult StructuralMerger::merge(const domain::SourceUnit& original, const domain::FileVerdict& verdict) const {
    if (!verdict.violation) {
        domain::MergeResult result;
        result.finalText = original.text;
        result.status = domain::MergeStatus::Merged;
        result.detail = "no violation";
        return result;
    }

    bool originalParsed = false;
    try {
        // Step 1: the original must parse for any structural work.
        domain::ParseOutcome parsedOriginal = m_parser->parse(original.text);
        if (!parsedOriginal) {
            return fallback(original, verdict, false, domain::MergeStatus::Failed,
                            "original does not parse: " + parsedOriginal.error.toString());
        }
        originalParsed = true;

        // Step 2: the whole fix as one unit.
        bool hasFallbackChunk = std::any_of(verdict.chunks.begin(), verdict.chunks.end(),
                                            [](const domain::ChunkVerdict& c) { return c.isFallback(); });
        std::string wholeFixError;
        if (!hasFallbackChunk) {
            domain::ParseOutcome parsedFix = m_parser->parse(verdict.aggregatedFix);
            if (parsedFix && !parsedFix.unit->types.empty()) {
                domain::ParsedUnit working = *parsedOriginal.unit;
                if (mergeInto(working, *parsedFix.unit)) {
                    std::string text = working.render();
                    if (m_parser->accepts(text)) {
                        domain::MergeResult result;
                        result.finalText = std::move(text);
                        result.status = domain::MergeStatus::Merged;
                        return result;
                    }
                    wholeFixError = "merged text no longer parses";
                } else {
                    wholeFixError = "no declaration of the fix matches the original";
                }
            } else {
                wholeFixError = parsedFix ? "fix declares no types" : parsedFix.error.toString();
            }
        } else {
            wholeFixError = "fix contains fallback chunks";
        }

        // Step 3: block by block.
        domain::ParsedUnit working = *parsedOriginal.unit;
        std::vector<std::string> failedBlocks;
        int mergedBlocks = 0;
        for (const auto& block : SplitFixBlocks(verdict.aggregatedFix)) {
            domain::ParseOutcome parsedBlock = m_parser->parse(block);
            if (parsedBlock && mergeInto(working, *parsedBlock.unit)) {
                ++mergedBlocks;
            } else {
                failedBlocks.push_back(block);
            }
        }

        if (mergedBlocks > 0) {
            std::string text = working.render();
            if (!failedBlocks.empty()) {
                text = WithAnnotation(text, kPartialHeader, Join(failedBlocks, kBlockSeparator));
            }
            if (m_parser->accepts(text)) {
                domain::MergeResult result;
                result.finalText = std::move(text);
                result.status = domain::MergeStatus::PartiallyMerged;
                result.unmergedBlocks = std::move(failedBlocks);
                result.detail = wholeFixError;
                return result;
            }
            wholeFixError = "partially merged text no longer parses";
        }

        // Step 4: heuristics only.
        return fallback(original, verdict, true, domain::MergeStatus::Unmerged, wholeFixError);
    } catch (const std::exception& e) {
        std::cerr << "[StructuralMerger] " << original.id << ": merge aborted: " << e.what() << std::endl;
        domain::MergeResult result;
        result.status = originalParsed ? domain::MergeStatus::Unmerged : domain::MergeStatus::Failed;
        result.finalText = WithAnnotation(original.text, originalParsed ? kUnmergedHeader : kFailedHeader,
                                          verdict.aggregatedFix);
        result.unmergedBlocks = {verdict.aggregatedFix};
        result.detail = e.what();
        return result;
    }
}

domain::MergeResult StructuralMerger::fallback(const domain::SourceUnit& original, const domain::FileVerdict& verdict,
                                               bool originalParsed, domain::MergeStatus status,
                                               const std::string& detail) const {
    std::string text = applyHeuristics(original.text);
    std::string note = detail;
    if (originalParsed && !m_parser->accepts(text)) {
        text = original.text;
        note += "; heuristic edits discarded";
    }

    std::cerr << "[StructuralMerger] " << original.id << ": " << domain::MergeStatusToString(status)
              << " (" << note << ")" << std::endl;

    domain::MergeResult result;
    result.status = status;
    result.finalText = WithAnnotation(text, status == domain::MergeStatus::Failed ? kFailedHeader : kUnmergedHeader,
                                      verdict.aggregatedFix);
    result.unmergedBlocks = {verdict.aggregatedFix};
    result.detail = note;
    return result;
}

bool StructuralMerger::mergeInto(domain::ParsedUnit& target, const domain::ParsedUnit& fix) const {
    bool matched = false;
    for (const auto& fixType : fix.types) {
        domain::TypeDeclaration* type = target.findType(fixType.name);
        if (!type) continue;
        matched = true;

        applyRules(*type);
        for (const auto& member : fixType.members) {
            if (!member.isCallable() || isRemoved(member.name)) continue;
            if (type->findCallable(member.name)) continue;
            domain::Member added = member;
            added.edited = false;
            type->members.push_back(std::move(added));
            type->edited = true;
        }
    }
    return matched;
}

void StructuralMerger::applyRules(domain::TypeDeclaration& type) const {
    auto removed = std::remove_if(type.members.begin(), type.members.end(), [this](const domain::Member& m) {
        return m.isCallable() && isRemoved(m.name);
    });
    if (removed != type.members.end()) {
        type.members.erase(removed, type.members.end());
        type.edited = true;
    }

    if (m_strategy.domainKeywords.empty()) return;
    for (auto& member : type.members) {
        if (!member.isCallable() || !member.hasBody) continue;
        auto checks = std::remove_if(member.statements.begin(), member.statements.end(), [this](const domain::Statement& s) {
            return s.isConditional && mentionsDomainKeyword(s.condition);
        });
        if (checks != member.statements.end()) {
            member.statements.erase(checks, member.statements.end());
            member.edited = true;
            type.edited = true;
        }
    }
}

bool StructuralMerger::isRemoved(const std::string& memberName) const {
    return std::find(m_strategy.removalList.begin(), m_strategy.removalList.end(), memberName) != m_strategy.removalList.end();
}

bool StructuralMerger::mentionsDomainKeyword(const std::string& condition) const {
    std::string lowered = ToLower(condition);
    for (const auto& keyword : m_strategy.domainKeywords) {
        if (!keyword.empty() && lowered.find(ToLower(keyword)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string StructuralMerger::applyHeuristics(const std::string& text) const {
    return removeDomainChecks(removeMethods(text));
}

std::string StructuralMerger::removeMethods(const std::string& text) const {
    static const std::regex declarationPrefix(R"(^\s*(?:@[\w.]+(?:\([^)]*\))?\s*)*(?:[\w<>\[\],.?]+\s+)*$)");

    std::string out = text;
    for (const auto& name : m_strategy.removalList) {
        if (!IsIdentifier(name)) continue;
        // The prefix check below requires whitespace or line start before the name.
        const std::regex declaration(IdentifierPattern(name) + R"(\s*\([^)]*\)\s*(?:throws\s+[\w.,\s]+?)?\{)");
        std::vector<bool> mask = CodeMask(out);

        std::vector<TextEdit> edits;
        size_t lastEnd = 0;
        for (std::sregex_iterator it(out.begin(), out.end(), declaration), end; it != end; ++it) {
            size_t pos = static_cast<size_t>(it->position());
            if (mask[pos] || pos < lastEnd) continue;

            size_t lineStart = out.rfind('\n', pos);
            lineStart = lineStart == std::string::npos ? 0 : lineStart + 1;
            std::string prefix = out.substr(lineStart, pos - lineStart);
            if (!std::regex_match(prefix, declarationPrefix)) continue;

            size_t open = pos + static_cast<size_t>(it->length()) - 1;
            size_t close = MatchClosing(out, mask, open, '{', '}');
            if (close == std::string::npos) continue;

            size_t begin = SkipWhitespace(out, lineStart);
            edits.push_back({begin, close + 1, "// removed " + name + " per domain rule"});
            lastEnd = close + 1;
        }
        out = ApplyEdits(out, edits);
    }
    return out;
}

std::string StructuralMerger::removeDomainChecks(const std::string& text) const {
    if (m_strategy.domainKeywords.empty()) return text;
    static const std::regex ifHead(R"(\bif\s*\()");

    std::vector<bool> mask = CodeMask(text);
    std::vector<TextEdit> edits;
    size_t lastEnd = 0;
    for (std::sregex_iterator it(text.begin(), text.end(), ifHead), end; it != end; ++it) {
        size_t pos = static_cast<size_t>(it->position());
        if (mask[pos] || pos < lastEnd) continue;
        if (EndsWithWord(text, pos, "else")) continue;

        size_t parenOpen = pos + static_cast<size_t>(it->length()) - 1;
        size_t parenClose = MatchClosing(text, mask, parenOpen, '(', ')');
        if (parenClose == std::string::npos) continue;
        if (!mentionsDomainKeyword(text.substr(parenOpen + 1, parenClose - parenOpen - 1))) continue;

        size_t body = SkipWhitespace(text, parenClose + 1);
        if (body >= text.size()) continue;
        size_t stop;
        if (text[body] == '{') {
            size_t close = MatchClosing(text, mask, body, '{', '}');
            stop = close == std::string::npos ? close : close + 1;
        } else {
            stop = StatementEnd(text, mask, body);
        }
        if (stop == std::string::npos) continue;
        if (StartsWithWord(text, SkipWhitespace(text, stop), "else")) continue;

        edits.push_back({pos, stop, "// removed domain check"});
        lastEnd = stop;
    }
    return ApplyEdits(text, edits);
}

std::vector<std::string> StructuralMerger::SplitFixBlocks(const std::string& aggregatedFix) {
    static const std::regex noViolation(R"(^//--- chunk \d+ => no violation\s*$)");
    const std::string fixPrefix = ResultAggregator::kFixMarkerPrefix;

    std::vector<std::string> blocks;
    std::string current;
    auto flush = [&]() {
        if (!IsBlank(current)) blocks.push_back(current);
        current.clear();
    };

    std::istringstream in(aggregatedFix);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind(fixPrefix, 0) == 0) {
            flush();
            continue;
        }
        if (std::regex_match(line, noViolation)) continue;
        current += line;
        current += "\n";
    }
    flush();
    return blocks;
}

} // namespace archmend::application
