#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace h5cx
{

/**
 * @brief When file contents are pushed to the storage device.
 *
 * Modes ending in "Block" fsync in the calling thread; the others hand the
 * fsync to the background SyncWorker. "OnFlush" modes sync on every
 * H5File::flush(), the remaining ones only when the file is closed.
 */
enum class SyncMode {
    NoSync,
    Sync,
    SyncBlock,
    SyncOnFlush,
    SyncOnFlushBlock
};

/** @brief Parse "no_sync", "sync", "sync_block", "sync_on_flush", "sync_on_flush_block" */
SyncMode syncModeFromString(const std::string& s);
std::string toString(SyncMode mode);

/** fsync happens in the caller's thread */
bool isBlocking(SyncMode mode);
/** fsync is handed to the SyncWorker */
bool isNonBlocking(SyncMode mode);
/** a sync is due on flush(); every mode except NoSync */
bool syncsOnFlush(SyncMode mode);
/** a sync is due on close() */
bool syncsOnClose(SyncMode mode);

/** @brief Per-container options */
struct ContainerConfig {
    SyncMode syncMode = SyncMode::NoSync;
    /** reuse a committed compound type of the same name without comparing */
    bool preferExistingTypes = false;
    /** replace a committed compound type whose layout conflicts */
    bool replaceConflictingTypes = true;
    /** truncate an existing file on create() */
    bool overwrite = false;
    std::string logLevel = "info";
    std::string logFile;

    static ContainerConfig fromJson(const nlohmann::json& json, const std::string& context = "config");
    static ContainerConfig load(const std::filesystem::path& path);
    nlohmann::json toJson() const;

    /** Apply logLevel and logFile to the process-wide logger */
    void applyLogging() const;
};

}  // namespace h5cx
