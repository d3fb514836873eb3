/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace archmend::infrastructure {

/**
 * @struct WriteTask
 * @brief Represents a single file write operation.
 */
struct WriteTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * Output files from concurrent unit tasks all pass through one queue, so two
 * writes to the same path never interleave.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Path to the file, parent directories are created.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every queued write has been performed.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /** @brief Number of writes that failed since construction. */
    size_t failedWrites() const { return m_failedWrites.load(); }

    /**
     * @brief Performs an atomic write (temp file, then rename) on the calling thread.
     * @return True on success; failures are logged.
     */
    static bool WriteAtomically(const std::string& filename, const std::string& content);

private:
    void workerLoop();

    std::queue<WriteTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    bool m_busy = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_failedWrites{0};
};

} // namespace archmend::infrastructure
