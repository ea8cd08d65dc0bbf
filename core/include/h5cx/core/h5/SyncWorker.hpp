#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <filesystem>
#include <mutex>
#include <thread>

namespace h5cx::h5
{

/**
 * @brief Background thread that fsyncs one file on request.
 *
 * Holds its own read-only descriptor of the file. Commands are processed
 * in the order they are posted. A failed fsync is logged, ends the worker
 * and is rethrown from finish().
 */
class SyncWorker
{
public:
    enum class Command {
        /** fsync the descriptor */
        Sync,
        /** close the descriptor and stop */
        CloseSync,
        /** stop without touching the descriptor */
        Exit
    };

    /** @throws StorageError if the file cannot be opened */
    explicit SyncWorker(const std::filesystem::path& path);

    /** Stops the worker if finish() was not called */
    ~SyncWorker();

    SyncWorker(const SyncWorker&) = delete;
    SyncWorker& operator=(const SyncWorker&) = delete;

    void post(Command command);

    /** fsync in the calling thread; @throws StorageError on failure */
    void syncNow();

    /** Close the descriptor in the calling thread */
    void closeDescriptor();

    /**
     * @brief Wait for the worker to stop.
     *
     * Requires a CloseSync or Exit to have been posted.
     *
     * @throws StorageError if the worker failed
     */
    void finish();

    /** Number of successful fsync calls so far, from either thread */
    std::size_t syncCount() const { return syncs_.load(); }

private:
    void run();
    void fsyncDescriptor();

    std::filesystem::path path_;
    std::mutex fdMutex_;
    int fd_ = -1;

    std::mutex queueMutex_;
    std::condition_variable queueCV_;
    std::deque<Command> queue_;

    std::exception_ptr failure_;
    std::atomic<std::size_t> syncs_{0};
    std::thread thread_;
};

/** @brief fsync a file through a descriptor of its own; @throws StorageError */
void fsyncFile(const std::filesystem::path& path);

}  // namespace h5cx::h5
