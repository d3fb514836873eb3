#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <future>
#include "application/ValidationLoop.hpp"
#include "application/WorkerPool.hpp"
#include "infrastructure/InMemoryReferenceIndex.hpp"
#include "infrastructure/JavaStructureParser.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "TestDoubles.hpp"

using archmend::application::WorkerPool;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Worker pool: every task runs once, results flow through futures.
    {
        WorkerPool pool(4, "StressPool");
        std::atomic<int> executed{0};
        std::vector<std::future<int>> results;
        for (int i = 0; i < 200; ++i) {
            results.push_back(pool.submit([i, &executed]() {
                executed++;
                return i * 2;
            }));
        }
        int sum = 0;
        for (auto& f : results) sum += f.get();
        assert(sum == 2 * (199 * 200 / 2));

        auto failing = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
        bool rethrown = false;
        try {
            failing.get();
        } catch (const std::runtime_error&) {
            rethrown = true;
        }
        assert(rethrown);

        assert(pool.shutdown(std::chrono::milliseconds(2000)));
        assert(executed == 200);

        bool rejected = false;
        try {
            pool.submit([]() { return 0; });
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        assert(rejected);
        std::cout << "[PASS] WorkerPool ran 200 tasks and refused work after shutdown." << std::endl;
    }

    // Reference index: concurrent writers and readers.
    {
        auto index = std::make_shared<archmend::infrastructure::InMemoryReferenceIndex>();
        const int NUM_WRITERS = 8;
        const int PER_WRITER = 50;
        std::vector<std::thread> threads;
        std::atomic<int> searches{0};

        for (int w = 0; w < NUM_WRITERS; ++w) {
            threads.emplace_back([&, w]() {
                BagOfWordsEmbedder local(32);
                for (int i = 0; i < PER_WRITER; ++i) {
                    std::string text = "writer " + std::to_string(w) + " snippet " + std::to_string(i);
                    index->upsert("w" + std::to_string(w) + "_" + std::to_string(i), local.embed(text), {{"content", text}});
                }
            });
            threads.emplace_back([&]() {
                BagOfWordsEmbedder local(32);
                for (int i = 0; i < PER_WRITER; ++i) {
                    auto hits = index->search(local.embed("snippet"), 5);
                    assert(hits.size() <= 5);
                    searches++;
                }
            });
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        assert(index->size() == static_cast<size_t>(NUM_WRITERS * PER_WRITER));
        assert(searches == NUM_WRITERS * PER_WRITER);
        std::cout << "[PASS] Index holds " << index->size() << " snippets after concurrent upserts." << std::endl;
    }

    // Persistence: concurrent producers, one serialized writer.
    {
        std::string testRoot = "test_project_root_concurrency";
        std::filesystem::remove_all(testRoot);
        auto persistence = std::make_shared<archmend::infrastructure::PersistenceService>();

        const int NUM_FILES = 40;
        std::vector<std::thread> threads;
        for (int i = 0; i < NUM_FILES; ++i) {
            threads.emplace_back([&persistence, &testRoot, i]() {
                persistence->saveTextAsync(testRoot + "/out/File" + std::to_string(i) + ".java", "class File" + std::to_string(i) + " {}");
                persistence->saveTextAsync(testRoot + "/shared.txt", "writer " + std::to_string(i));
            });
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        persistence->flush();

        int files = 0;
        for (const auto& entry : std::filesystem::directory_iterator(testRoot + "/out")) {
            if (entry.path().extension() == ".java") files++;
        }
        assert(files == NUM_FILES);

        std::ifstream shared(testRoot + "/shared.txt");
        std::string content;
        std::getline(shared, content);
        assert(content.rfind("writer ", 0) == 0);
        assert(persistence->failedWrites() == 0);

        persistence->stop();
        std::filesystem::remove_all(testRoot);
        std::cout << "[PASS] " << files << " files written without interleaving." << std::endl;
    }

    // Validation loops share only stateless collaborators.
    {
        auto model = std::make_shared<ScriptedTransformer>();
        model->setDelay(std::chrono::milliseconds(5));
        model->setDefault(VerdictJson(true, "repository logic", "class Fixed { }"));
        archmend::application::ValidationLoop loop(model, std::make_shared<archmend::infrastructure::JavaStructureParser>(),
                                                   archmend::application::LoopPrompts{});

        WorkerPool pool(6, "LoopPool");
        std::vector<std::future<archmend::domain::ChunkVerdict>> verdicts;
        for (int i = 1; i <= 30; ++i) {
            archmend::domain::Chunk chunk;
            chunk.unitId = "Unit.java";
            chunk.index = i;
            chunk.text = "class C" + std::to_string(i) + " { }";
            verdicts.push_back(pool.submit([&loop, chunk]() { return loop.run(chunk, "", 3); }));
        }
        for (int i = 1; i <= 30; ++i) {
            auto v = verdicts[static_cast<size_t>(i - 1)].get();
            assert(v.chunkIndex == i);
            assert(v.violation && v.fix == "class Fixed { }" && v.attempts == 1);
        }
        assert(pool.shutdown(std::chrono::milliseconds(2000)));
        assert(model->calls() == 30);
        std::cout << "[PASS] 30 concurrent validation loops completed independently." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
