#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/ResultAggregator.hpp"
#include "TestDoubles.hpp"

using namespace archmend;
using application::ResultAggregator;

static domain::ChunkVerdict Verdict(int index, bool violation, const std::string& reason, const std::string& fix) {
    domain::ChunkVerdict v;
    v.chunkIndex = index;
    v.violation = violation;
    v.reason = reason;
    v.fix = violation ? fix : "";
    v.attempts = 1;
    return v;
}

static void TestOrdersByChunkIndex() {
    ResultAggregator aggregator;
    auto unit = MakeUnit("legacy/Repo.java", "class Repo {}");

    // Completion order, not emission order.
    std::vector<domain::ChunkVerdict> verdicts = {
        Verdict(3, true, "stock check", "class C3 {}"),
        Verdict(1, false, "ok", ""),
        Verdict(2, true, "db call", "class C2 {}")
    };
    auto result = aggregator.aggregate(unit, verdicts);

    assert(result.unitId == "legacy/Repo.java");
    assert(result.violation);
    assert(result.chunks.size() == 3);
    assert(result.chunks[0].chunkIndex == 1);
    assert(result.chunks[2].chunkIndex == 3);

    const std::string expectedFix =
        "//--- chunk 1 => no violation\n"
        "//--- fix for chunk 2 ---\nclass C2 {}\n"
        "//--- fix for chunk 3 ---\nclass C3 {}\n";
    assert(result.aggregatedFix == expectedFix);
    assert(result.reason == "Chunk 1 => no violation\nChunk 2 => db call\nChunk 3 => stock check");

    std::vector<domain::ChunkVerdict> reversed(verdicts.rbegin(), verdicts.rend());
    assert(aggregator.aggregate(unit, reversed) == result);
    std::cout << "[PASS] Markers emitted in chunk order regardless of completion order." << std::endl;
}

static void TestAllClean() {
    ResultAggregator aggregator;
    auto unit = MakeUnit("Clean.java", "class Clean {}");
    auto result = aggregator.aggregate(unit, {Verdict(1, false, "", ""), Verdict(2, false, "", "")});
    assert(!result.violation);
    assert(result.aggregatedFix.find(ResultAggregator::kFixMarkerPrefix) == std::string::npos);
    assert(result.reason == "Chunk 1 => no violation\nChunk 2 => no violation");

    auto empty = aggregator.aggregate(unit, {});
    assert(!empty.violation && empty.aggregatedFix.empty() && empty.reason.empty());
    std::cout << "[PASS] Clean units carry no fix markers." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ResultAggregator Test..." << std::endl;
    TestOrdersByChunkIndex();
    TestAllClean();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
