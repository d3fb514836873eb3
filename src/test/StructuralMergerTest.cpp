#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "application/ResultAggregator.hpp"
#include "application/StructuralMerger.hpp"
#include "application/ValidationLoop.hpp"
#include "infrastructure/JavaStructureParser.hpp"
#include "TestDoubles.hpp"

using namespace archmend;
using application::MergeStrategy;
using application::ResultAggregator;
using application::StructuralMerger;
using domain::MergeStatus;

static std::shared_ptr<const domain::StructuralParser> Parser() {
    return std::make_shared<infrastructure::JavaStructureParser>();
}

static StructuralMerger DefaultMerger() {
    return StructuralMerger(Parser(), MergeStrategy{{"directDbCall"}, {"stock", "price"}});
}

static domain::ChunkVerdict Fix(int index, const std::string& fix) {
    domain::ChunkVerdict v;
    v.chunkIndex = index;
    v.violation = true;
    v.reason = "violation";
    v.fix = fix;
    v.attempts = 1;
    return v;
}

static bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static void TestMergedRemovesAndAdds() {
    auto merger = DefaultMerger();
    auto unit = MakeUnit("SomeDomainAggregate.java", DomainAggregateSource());
    auto verdict = ResultAggregator().aggregate(unit, {Fix(1,
        "public class SomeDomainAggregate {\n"
        "    public String getId() { return id; }\n"
        "    public void reserve(int n) { this.stock -= n; }\n"
        "}")});

    auto result = merger.merge(unit, verdict);
    assert(result.status == MergeStatus::Merged);
    assert(!Contains(result.finalText, "directDbCall"));
    assert(Contains(result.finalText, "public void reserve(int n)"));
    assert(result.finalText.rfind("package com.example.legacy;", 0) == 0);
    assert(Parser()->accepts(result.finalText));
    std::cout << "[PASS] Whole fix merged: removal-listed method dropped, new method added." << std::endl;
}

static void TestMergedRemovesDomainChecks() {
    auto merger = DefaultMerger();
    auto unit = MakeUnit("InventoryRepository.java", InventoryRepositorySource());
    auto verdict = ResultAggregator().aggregate(unit, {Fix(1, "public class InventoryRepository { }")});

    auto result = merger.merge(unit, verdict);
    assert(result.status == MergeStatus::Merged);
    assert(!Contains(result.finalText, "Huge stock"));
    assert(!Contains(result.finalText, "negative stock"));
    assert(Contains(result.finalText, "return agg;"));
    assert(Contains(result.finalText, "Saving aggregate"));
    assert(Contains(result.finalText, " * JPA repository that also includes domain logic."));
    std::cout << "[PASS] Conditionals mentioning domain keywords removed." << std::endl;
}

static void TestPartiallyMerged() {
    auto merger = DefaultMerger();
    auto unit = MakeUnit("InventoryRepository.java", InventoryRepositorySource());
    auto verdict = ResultAggregator().aggregate(unit, {
        Fix(1, "public class InventoryRepository { }"),
        Fix(2, "this is not java")
    });

    auto result = merger.merge(unit, verdict);
    assert(result.status == MergeStatus::PartiallyMerged);
    assert(result.unmergedBlocks.size() == 1);
    assert(result.unmergedBlocks[0] == "this is not java\n");
    assert(Contains(result.finalText, "Un-merged snippet blocks:"));
    assert(Contains(result.finalText, "this is not java"));
    assert(!Contains(result.finalText, "Huge stock"));
    assert(Parser()->accepts(result.finalText));
    std::cout << "[PASS] Good block merged, bad block kept as annotation." << std::endl;
}

static void TestUnmergedKeepsFallbackText() {
    auto merger = DefaultMerger();
    auto unit = MakeUnit("InventoryRepository.java", InventoryRepositorySource());

    domain::ChunkVerdict exhausted = Fix(1, application::ValidationLoop::FallbackFix("if (x) { /* odd */"));
    exhausted.kind = domain::ChunkVerdictKind::ExhaustedFallback;
    exhausted.reason = application::ValidationLoop::kExhaustedReason;
    auto verdict = ResultAggregator().aggregate(unit, {exhausted});

    auto result = merger.merge(unit, verdict);
    assert(result.status == MergeStatus::Unmerged);
    assert(Contains(result.finalText, "Entire snippet could not be merged after chunk attempts:"));
    assert(Contains(result.finalText, "needs manual attention"));
    assert(Contains(result.finalText, "// removed domain check"));
    assert(!Contains(result.finalText, "Huge stock"));
    assert(Parser()->accepts(result.finalText));
    std::cout << "[PASS] Exhausted chunks degrade to heuristics with the fix annotated." << std::endl;
}

static void TestFailedWhenOriginalUnparseable() {
    auto merger = DefaultMerger();
    const std::string broken =
        "public class Legacy {\n"
        "    public void directDbCall() {\n"
        "        db();\n"
        "    }\n"
        "    void g() { int a = 1 }\n"
        "}\n";
    auto unit = MakeUnit("Legacy.java", broken);
    auto verdict = ResultAggregator().aggregate(unit, {Fix(1, "public class Legacy { void g() { int a = 1; } }")});

    auto result = merger.merge(unit, verdict);
    assert(result.status == MergeStatus::Failed);
    assert(Contains(result.finalText, "Snippet (entire) unparseable due to original parse fail:"));
    assert(Contains(result.finalText, "// removed directDbCall per domain rule"));
    assert(Contains(result.finalText, "void g() { int a = 1; }"));
    assert(Contains(result.detail, "original does not parse"));
    std::cout << "[PASS] Unparseable original yields Failed with heuristic edits." << std::endl;
}

static void TestNoViolationIsIdentity() {
    auto merger = DefaultMerger();
    auto unit = MakeUnit("InventoryRepository.java", InventoryRepositorySource());
    domain::FileVerdict clean;
    clean.unitId = unit.id;
    auto result = merger.merge(unit, clean);
    assert(result.status == MergeStatus::Merged);
    assert(result.finalText == unit.text);
    std::cout << "[PASS] Clean verdict leaves the text untouched." << std::endl;
}

static void TestHeuristics() {
    auto merger = DefaultMerger();

    const std::string annotated =
        "class A {\n"
        "    @Deprecated public void directDbCall() {\n"
        "        run(\"}\");\n"
        "    }\n"
        "    void caller() { directDbCall(); }\n"
        "}\n";
    std::string out = merger.applyHeuristics(annotated);
    assert(Contains(out, "    // removed directDbCall per domain rule\n"));
    assert(!Contains(out, "@Deprecated"));
    assert(Contains(out, "directDbCall(); }"));

    const std::string chained = "void f() { if (stock > 0) { a(); } else { b(); } }";
    assert(merger.applyHeuristics(chained) == chained);

    const std::string quoted = "void f() { log(\"if (stock) {\"); }";
    assert(merger.applyHeuristics(quoted) == quoted);

    std::string inlineIf = merger.applyHeuristics("void f() {\n    if (PRICE < 0) return; next();\n}\n");
    assert(Contains(inlineIf, "// removed domain check\n next();"));
    std::cout << "[PASS] Text heuristics respect literals, else chains and line layout." << std::endl;
}

static void TestHeuristicsWithDollarNames() {
    StructuralMerger merger(Parser(), MergeStrategy{{"load$Cached", "$audit"}, {}});
    const std::string text =
        "class B {\n"
        "    void load$Cached() { hit(); }\n"
        "    void reload$Cached() { keep(); }\n"
        "    private void $audit() { x(); }\n"
        "}\n";
    std::string out = merger.applyHeuristics(text);
    assert(Contains(out, "    // removed load$Cached per domain rule\n"));
    assert(Contains(out, "    void reload$Cached() { keep(); }\n"));
    assert(Contains(out, "    // removed $audit per domain rule\n"));
    assert(!Contains(out, "hit();"));
    assert(!Contains(out, "x();"));
    std::cout << "[PASS] Removal names containing '$' are matched literally." << std::endl;
}

static void TestSplitFixBlocks() {
    const std::string aggregated =
        "//--- chunk 1 => no violation\n"
        "//--- fix for chunk 2 ---\n"
        "class A {}\n"
        "//--- fix for chunk 3 ---\n"
        "\n";
    auto blocks = StructuralMerger::SplitFixBlocks(aggregated);
    assert(blocks.size() == 1);
    assert(blocks[0] == "class A {}\n");
    assert(StructuralMerger::SplitFixBlocks("").empty());
    std::cout << "[PASS] Fix blocks split on markers." << std::endl;
}

int main() {
    std::cout << "[Test] Starting StructuralMerger Test..." << std::endl;
    TestMergedRemovesAndAdds();
    TestMergedRemovesDomainChecks();
    TestPartiallyMerged();
    TestUnmergedKeepsFallbackText();
    TestFailedWhenOriginalUnparseable();
    TestNoViolationIsIdentity();
    TestHeuristics();
    TestHeuristicsWithDollarNames();
    TestSplitFixBlocks();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
