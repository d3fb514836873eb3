/**
 * @file ResultAggregator.cpp
 * @brief Implementation of the ResultAggregator.
 */

#include "application/ResultAggregator.hpp"
#include <algorithm>
#include <sstream>

namespace archmend::application {

const char* const ResultAggregator::kFixMarkerPrefix = "//--- fix for chunk ";

std::string ResultAggregator::FixMarker(int chunkIndex) {
    return std::string(kFixMarkerPrefix) + std::to_string(chunkIndex) + " ---\n";
}

std::string ResultAggregator::NoViolationMarker(int chunkIndex) {
    return "//--- chunk " + std::to_string(chunkIndex) + " => no violation\n";
}

domain::FileVerdict ResultAggregator::aggregate(const domain::SourceUnit& unit, std::vector<domain::ChunkVerdict> verdicts) const {
    std::stable_sort(verdicts.begin(), verdicts.end(), [](const domain::ChunkVerdict& a, const domain::ChunkVerdict& b) {
        return a.chunkIndex < b.chunkIndex;
    });

    domain::FileVerdict result;
    result.unitId = unit.id;

    std::stringstream fix;
    std::stringstream reason;
    bool first = true;
    for (const auto& verdict : verdicts) {
        if (!first) reason << "\n";
        first = false;
        if (verdict.violation) {
            result.violation = true;
            fix << FixMarker(verdict.chunkIndex) << verdict.fix << "\n";
            reason << "Chunk " << verdict.chunkIndex << " => " << verdict.reason;
        } else {
            fix << NoViolationMarker(verdict.chunkIndex);
            reason << "Chunk " << verdict.chunkIndex << " => no violation";
        }
    }

    result.aggregatedFix = fix.str();
    result.reason = reason.str();
    result.chunks = std::move(verdicts);
    return result;
}

} // namespace archmend::application
