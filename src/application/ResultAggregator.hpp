/**
 * @file ResultAggregator.hpp
 * @brief Folds per-chunk verdicts into one FileVerdict.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/SourceUnit.hpp"
#include "domain/Verdict.hpp"

namespace archmend::application {

class ResultAggregator {
public:
    /** @brief Prefix shared by every fix marker; the merger splits on it. */
    static const char* const kFixMarkerPrefix;

    /**
     * @brief Builds the FileVerdict for a unit.
     *
     * Verdicts are ordered by chunk index before folding, so the caller may
     * pass them in completion order.
     */
    domain::FileVerdict aggregate(const domain::SourceUnit& unit, std::vector<domain::ChunkVerdict> verdicts) const;

    static std::string FixMarker(int chunkIndex);
    static std::string NoViolationMarker(int chunkIndex);
};

} // namespace archmend::application
