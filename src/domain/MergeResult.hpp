/**
 * @file MergeResult.hpp
 * @brief Tagged outcome of the structural merge degradation chain.
 */

#pragma once
#include <string>
#include <vector>

namespace archmend::domain {

/**
 * @enum MergeStatus
 * @brief Which stage of the degradation chain produced the final text.
 */
enum class MergeStatus {
    Merged,           ///< Whole fix merged structurally.
    PartiallyMerged,  ///< Some chunk blocks merged, the rest kept as a trailing annotation.
    Unmerged,         ///< Heuristic edits only, fix appended as annotation.
    Failed            ///< Original did not parse, heuristic edits only.
};

inline std::string MergeStatusToString(MergeStatus status) {
    switch (status) {
        case MergeStatus::Merged: return "Merged";
        case MergeStatus::PartiallyMerged: return "PartiallyMerged";
        case MergeStatus::Unmerged: return "Unmerged";
        case MergeStatus::Failed: return "Failed";
    }
    return "Failed";
}

/**
 * @struct MergeResult
 * @brief Final text plus the tag describing how it was obtained.
 */
struct MergeResult {
    std::string finalText;
    MergeStatus status = MergeStatus::Failed;
    std::vector<std::string> unmergedBlocks; ///< Verbatim blocks embedded as annotation.
    std::string detail;                      ///< Parse error or note, for logging.
};

} // namespace archmend::domain
