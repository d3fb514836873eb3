/**
 * @file StructuralMerger.hpp
 * @brief Fuses a validated FileVerdict back into the original source.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/MergeResult.hpp"
#include "domain/SourceTree.hpp"
#include "domain/SourceUnit.hpp"
#include "domain/StructuralParser.hpp"
#include "domain/Verdict.hpp"

namespace archmend::application {

/**
 * @struct MergeStrategy
 * @brief Declaration-level rules applied to every matched type.
 */
struct MergeStrategy {
    std::vector<std::string> removalList;     ///< Callable members to delete by name.
    std::vector<std::string> domainKeywords;  ///< if-conditions mentioning one of these are removed.
};

/**
 * @class StructuralMerger
 * @brief Degradation chain: whole-fix merge, per-block merge, heuristic edits.
 *
 * merge() never throws. Every path ends with a final text and a status tag,
 * and a text that parsed before merging still parses afterwards.
 */
class StructuralMerger {
public:
    StructuralMerger(std::shared_ptr<const domain::StructuralParser> parser, MergeStrategy strategy);

    domain::MergeResult merge(const domain::SourceUnit& original, const domain::FileVerdict& verdict) const;

    /** @brief Pattern-based version of the merge rules, applied to raw text. */
    std::string applyHeuristics(const std::string& text) const;

    /**
     * @brief Splits an aggregated fix on its fix markers.
     *
     * No-violation markers are dropped; blocks left blank are skipped.
     */
    static std::vector<std::string> SplitFixBlocks(const std::string& aggregatedFix);

private:
    bool mergeInto(domain::ParsedUnit& target, const domain::ParsedUnit& fix) const;
    void applyRules(domain::TypeDeclaration& type) const;
    bool isRemoved(const std::string& memberName) const;
    bool mentionsDomainKeyword(const std::string& condition) const;

    std::string removeMethods(const std::string& text) const;
    std::string removeDomainChecks(const std::string& text) const;

    domain::MergeResult fallback(const domain::SourceUnit& original, const domain::FileVerdict& verdict,
                                 bool originalParsed, domain::MergeStatus status, const std::string& detail) const;

    std::shared_ptr<const domain::StructuralParser> m_parser;
    MergeStrategy m_strategy;
};

} // namespace archmend::application
