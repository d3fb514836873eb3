#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/SourceScanner.hpp"

using namespace archmend;
using infrastructure::ConfigLoader;
namespace fs = std::filesystem;

static void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static bool Rejects(const std::string& path) {
    try {
        ConfigLoader::Load(path, true);
    } catch (const std::invalid_argument& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

static void TestDefaultsAndOverrides() {
    fs::path root = fs::temp_directory_path() / "archmend_config_test";
    fs::remove_all(root);

    auto defaults = ConfigLoader::Load((root / "missing.json").string());
    assert(defaults.maxLines == 300 && defaults.maxChars == 1000);
    assert(defaults.maxAttempts == 3);
    assert(defaults.vectorProvider == "inmemory");
    assert(defaults.removalList.size() == 1 && defaults.removalList[0] == "directDbCall");
    assert(Rejects((root / "missing.json").string()));

    WriteFile(root / "archmend.json", R"({
        "chunk": { "maxLines": 120, "overlap": 10 },
        "loop": { "maxAttempts": 5 },
        "run": { "concurrency": 8 },
        "merge": { "removalList": ["directDbCall", "rawSql"], "domainKeywords": ["discount"] },
        "rag": { "relevanceThreshold": 0.5, "queryChars": 200 },
        "vectordb": { "provider": "remote", "remote": { "url": "http://localhost:9000", "namespace": "refs" } },
        "ollama": { "chatModel": "qwen2.5-coder" },
        "unknownSection": { "ignored": true }
    })");
    auto config = ConfigLoader::Load((root / "archmend.json").string(), true);
    assert(config.maxLines == 120 && config.lineOverlap == 10);
    assert(config.maxChars == 1000);
    assert(config.maxAttempts == 5);
    assert(config.concurrency == 8);
    assert(config.removalList.size() == 2 && config.domainKeywords[0] == "discount");
    assert(config.relevanceThreshold == 0.5f && config.queryChars == 200);
    assert(config.vectorProvider == "remote" && config.remoteNamespace == "refs");
    assert(config.chatModel == "qwen2.5-coder");
    std::cout << "[PASS] Defaults and file overrides." << std::endl;

    WriteFile(root / "bad_overlap.json", R"({ "chunk": { "maxLines": 10, "overlap": 10 } })");
    assert(Rejects((root / "bad_overlap.json").string()));
    WriteFile(root / "bad_type.json", R"({ "loop": { "maxAttempts": "three" } })");
    assert(Rejects((root / "bad_type.json").string()));
    WriteFile(root / "bad_json.json", "{ \"chunk\": ");
    assert(Rejects((root / "bad_json.json").string()));
    WriteFile(root / "bad_remote.json", R"({ "vectordb": { "provider": "remote" } })");
    assert(Rejects((root / "bad_remote.json").string()));
    WriteFile(root / "bad_provider.json", R"({ "vectordb": { "provider": "faiss" } })");
    assert(Rejects((root / "bad_provider.json").string()));
    std::cout << "[PASS] Invalid configurations rejected before any work starts." << std::endl;
    fs::remove_all(root);
}

static void TestSourceScanner() {
    fs::path root = fs::temp_directory_path() / "archmend_scanner_test";
    fs::remove_all(root);
    WriteFile(root / "src" / "b" / "Repo.java", "class Repo {}\n");
    WriteFile(root / "src" / "a" / "Agg.JAVA", "class Agg {}\n");
    WriteFile(root / "docs" / "guide.md", "# Guide\n");
    WriteFile(root / "notes.txt", "notes");
    WriteFile(root / "image.png", "binary");

    infrastructure::SourceScanner scanner(root.string());
    auto units = scanner.scan();
    assert(units.size() == 4);
    assert(units[0].id == "docs/guide.md" && units[0].type == domain::ContentType::Markdown);
    assert(units[1].id == "notes.txt" && units[1].type == domain::ContentType::PlainText);
    assert(units[2].id == "src/a/Agg.JAVA" && units[2].type == domain::ContentType::Java);
    assert(units[3].id == "src/b/Repo.java");
    assert(units[3].text == "class Repo {}\n");
    assert(units[3].contentHash == infrastructure::ContentHasher::Sha256Hex("class Repo {}\n"));

    bool threw = false;
    try {
        infrastructure::SourceScanner((root / "notes.txt").string()).scan();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(root);
    std::cout << "[PASS] Scanner keeps java/md/txt, sorted by relative id." << std::endl;
}

static bool RejectsEvaluationSet(const std::string& path) {
    try {
        ConfigLoader::LoadEvaluationSet(path);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void TestEvaluationSet() {
    fs::path root = fs::temp_directory_path() / "archmend_eval_set_test";
    fs::remove_all(root);
    WriteFile(root / "eval.json", R"({
        "queries": [
            { "query": "aggregate invariants", "keywords": ["invariant", "aggregate"] },
            { "query": "ports" }
        ],
        "groups": { "aggregates": ["agg1", "agg2"] }
    })");

    auto set = ConfigLoader::LoadEvaluationSet((root / "eval.json").string());
    assert(set.queries.size() == 2);
    assert(set.queries[0].query == "aggregate invariants");
    assert(set.queries[0].expectedKeywords.size() == 2 && set.queries[0].expectedKeywords[1] == "aggregate");
    assert(set.queries[1].expectedKeywords.empty());
    assert(set.documentGroups.at("aggregates").size() == 2);

    WriteFile(root / "bad_query.json", R"({ "queries": [ { "query": 42 } ] })");
    assert(RejectsEvaluationSet((root / "bad_query.json").string()));
    WriteFile(root / "bad_groups.json", R"({ "groups": ["agg1"] })");
    assert(RejectsEvaluationSet((root / "bad_groups.json").string()));
    assert(RejectsEvaluationSet((root / "missing.json").string()));
    fs::remove_all(root);
    std::cout << "[PASS] Evaluation sets load; malformed sets rejected." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    TestDefaultsAndOverrides();
    TestSourceScanner();
    TestEvaluationSet();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
