#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "infrastructure/ContentCache.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "application/ValidationLoop.hpp"

using namespace archmend;
using infrastructure::ContentCache;
using infrastructure::ContentHasher;
namespace fs = std::filesystem;

static fs::path FreshDirectory(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    return dir;
}

static domain::FileVerdict SampleVerdict() {
    domain::FileVerdict verdict;
    verdict.unitId = "Repo.java";
    verdict.violation = true;
    verdict.reason = "Chunk 1 => max attempts reached";

    domain::ChunkVerdict chunk;
    chunk.chunkIndex = 1;
    chunk.kind = domain::ChunkVerdictKind::ExhaustedFallback;
    chunk.violation = true;
    chunk.reason = "max attempts reached";
    chunk.fix = "/*\nclass Repo {}\n*/";
    chunk.attempts = 3;
    verdict.chunks.push_back(chunk);
    verdict.aggregatedFix = "//--- fix for chunk 1 ---\n" + chunk.fix + "\n";
    return verdict;
}

static void TestHitAndMiss() {
    fs::path dir = FreshDirectory("archmend_cache_test");
    ContentCache cache(dir.string());

    const std::string text = "class Repo {}";
    const std::string hash = ContentHasher::Sha256Hex(text);
    assert(!cache.get(hash));

    cache.put(hash, SampleVerdict());
    auto hit = cache.get(hash);
    assert(hit && *hit == SampleVerdict());
    assert(hit->chunks[0].isFallback());

    // One byte changes the key.
    assert(!cache.get(ContentHasher::Sha256Hex("class Repo {} ")));
    assert(fs::exists(dir / (hash + ".json")));
    std::cout << "[PASS] Exact-content hit, single-byte change misses." << std::endl;
}

static void TestReloadFromDisk() {
    fs::path dir = FreshDirectory("archmend_cache_reload");
    const std::string hash = ContentHasher::Sha256Hex("class Reload {}");
    {
        ContentCache writer(dir.string());
        writer.put(hash, SampleVerdict());
    }
    ContentCache reader(dir.string());
    auto hit = reader.get(hash);
    assert(hit && *hit == SampleVerdict());

    // Corrupt entries read as misses.
    const std::string other = ContentHasher::Sha256Hex("class Corrupt {}");
    {
        std::ofstream corrupt(dir / (other + ".json"));
        corrupt << "{ not json";
    }
    assert(!reader.get(other));
    std::cout << "[PASS] Entries survive a restart; corrupt entries miss." << std::endl;
}

static void TestMalformedKeysAndDisabled() {
    ContentCache memoryOnly("");
    memoryOnly.put("not-a-hash", SampleVerdict());
    assert(!memoryOnly.get("not-a-hash"));
    assert(!ContentHasher::IsDigest("ABC"));

    const std::string hash = ContentHasher::Sha256Hex("x");
    assert(hash.size() == 64 && ContentHasher::IsDigest(hash));
    assert(ContentHasher::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    ContentCache disabled("", false);
    disabled.put(hash, SampleVerdict());
    assert(!disabled.get(hash));
    assert(!disabled.isEnabled());
    std::cout << "[PASS] Malformed keys rejected; disabled cache always misses." << std::endl;
}

static void TestNonUtf8FixStaysInMemory() {
    fs::path dir = FreshDirectory("archmend_cache_latin1");
    ContentCache cache(dir.string());

    const std::string latin1 = "// caf\xe9\nclass A {}";
    const std::string hash = ContentHasher::Sha256Hex(latin1);
    domain::FileVerdict verdict = SampleVerdict();
    verdict.unitId = "A.java";
    verdict.chunks[0].fix = application::ValidationLoop::FallbackFix(latin1);
    verdict.aggregatedFix = "//--- fix for chunk 1 ---\n" + verdict.chunks[0].fix + "\n";

    cache.put(hash, verdict);
    auto hit = cache.get(hash);
    assert(hit && *hit == verdict);
    assert(hit->aggregatedFix.find("caf\xe9") != std::string::npos);
    assert(!fs::exists(dir / (hash + ".json")));

    ContentCache fresh(dir.string());
    assert(!fresh.get(hash));
    std::cout << "[PASS] Non-UTF-8 fix kept in memory, not persisted." << std::endl;
}

static void TestUnwritableDirectory() {
    fs::path blocker = FreshDirectory("archmend_cache_blocker");
    {
        std::ofstream file(blocker);
        file << "a file where the cache directory should be";
    }
    ContentCache cache(blocker.string());
    const std::string hash = ContentHasher::Sha256Hex("class Blocked {}");

    cache.put(hash, SampleVerdict());
    auto hit = cache.get(hash);
    assert(hit && *hit == SampleVerdict());

    ContentCache fresh(blocker.string());
    assert(!fresh.get(hash));
    fs::remove(blocker);
    std::cout << "[PASS] Write failure is logged; the run keeps the entry in memory." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ContentCache Test..." << std::endl;
    TestHitAndMiss();
    TestReloadFromDisk();
    TestMalformedKeysAndDisabled();
    TestNonUtf8FixStaysInMemory();
    TestUnwritableDirectory();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
