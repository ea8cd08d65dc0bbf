#include "h5cx/core/h5/SyncWorker.hpp"

#include "h5cx/core/util/Errors.hpp"
#include "h5cx/core/util/Logging.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace h5cx::h5
{

void fsyncFile(const std::filesystem::path& path)
{
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw StorageError("cannot open " + path.string() + ": " + std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc < 0) {
        throw StorageError("fsync of " + path.string() + " failed: " + std::strerror(err));
    }
}

SyncWorker::SyncWorker(const std::filesystem::path& path) : path_(path)
{
    fd_ = ::open(path_.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw StorageError(
            "SyncWorker: cannot open " + path_.string() + ": " + std::strerror(errno));
    }
    thread_ = std::thread(&SyncWorker::run, this);
}

SyncWorker::~SyncWorker()
{
    if (thread_.joinable()) {
        post(Command::Exit);
        thread_.join();
    }
    std::lock_guard<std::mutex> lock(fdMutex_);
    if (fd_ >= 0 && ::close(fd_) < 0) {
        Logger()->warn("SyncWorker: closing {} failed: {}", path_.string(), std::strerror(errno));
    }
    fd_ = -1;
}

void SyncWorker::post(Command command)
{
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push_back(command);
    }
    queueCV_.notify_one();
}

void SyncWorker::syncNow()
{
    fsyncDescriptor();
}

void SyncWorker::closeDescriptor()
{
    std::lock_guard<std::mutex> lock(fdMutex_);
    if (fd_ >= 0) {
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) < 0) {
            throw StorageError(
                "SyncWorker: closing " + path_.string() + " failed: " + std::strerror(errno));
        }
    }
}

void SyncWorker::finish()
{
    if (thread_.joinable()) {
        thread_.join();
    }
    if (failure_) {
        auto failure = failure_;
        failure_ = nullptr;
        std::rethrow_exception(failure);
    }
}

void SyncWorker::fsyncDescriptor()
{
    std::lock_guard<std::mutex> lock(fdMutex_);
    if (fd_ < 0) {
        throw StorageError("SyncWorker: " + path_.string() + " is already closed");
    }
    if (::fsync(fd_) < 0) {
        throw StorageError(
            "SyncWorker: fsync of " + path_.string() + " failed: " + std::strerror(errno));
    }
    ++syncs_;
}

void SyncWorker::run()
{
    for (;;) {
        Command command;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCV_.wait(lock, [this] { return !queue_.empty(); });
            command = queue_.front();
            queue_.pop_front();
        }

        try {
            switch (command) {
                case Command::Sync:
                    fsyncDescriptor();
                    break;
                case Command::CloseSync:
                    closeDescriptor();
                    return;
                case Command::Exit:
                    return;
            }
        } catch (const Error& e) {
            Logger()->error("{}", e.what());
            failure_ = std::current_exception();
            return;
        }
    }
}

}  // namespace h5cx::h5
