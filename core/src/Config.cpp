#include "h5cx/core/util/Config.hpp"

#include "h5cx/core/util/Errors.hpp"
#include "h5cx/core/util/LoadJson.hpp"
#include "h5cx/core/util/Logging.hpp"

#include <nlohmann/json.hpp>

namespace h5cx
{

SyncMode syncModeFromString(const std::string& s)
{
    if (s == "no_sync") return SyncMode::NoSync;
    if (s == "sync") return SyncMode::Sync;
    if (s == "sync_block") return SyncMode::SyncBlock;
    if (s == "sync_on_flush") return SyncMode::SyncOnFlush;
    if (s == "sync_on_flush_block") return SyncMode::SyncOnFlushBlock;
    throw ConfigError("unknown sync mode: " + s);
}

std::string toString(SyncMode mode)
{
    switch (mode) {
        case SyncMode::NoSync:           return "no_sync";
        case SyncMode::Sync:             return "sync";
        case SyncMode::SyncBlock:        return "sync_block";
        case SyncMode::SyncOnFlush:      return "sync_on_flush";
        case SyncMode::SyncOnFlushBlock: return "sync_on_flush_block";
    }
    return "unknown";
}

bool isBlocking(SyncMode mode)
{
    return mode == SyncMode::SyncBlock || mode == SyncMode::SyncOnFlushBlock;
}

bool isNonBlocking(SyncMode mode)
{
    return mode == SyncMode::Sync || mode == SyncMode::SyncOnFlush;
}

bool syncsOnFlush(SyncMode mode)
{
    return mode != SyncMode::NoSync;
}

bool syncsOnClose(SyncMode mode)
{
    return mode == SyncMode::Sync || mode == SyncMode::SyncBlock;
}

ContainerConfig ContainerConfig::fromJson(const nlohmann::json& json, const std::string& context)
{
    if (!json.is_object()) {
        throw ConfigError(context + " must be a JSON object");
    }

    ContainerConfig cfg;
    cfg.syncMode = syncModeFromString(
        json::string_or(json, "sync_mode", toString(cfg.syncMode), context));
    cfg.preferExistingTypes =
        json::bool_or(json, "prefer_existing_types", cfg.preferExistingTypes, context);
    cfg.replaceConflictingTypes =
        json::bool_or(json, "replace_conflicting_types", cfg.replaceConflictingTypes, context);
    cfg.overwrite = json::bool_or(json, "overwrite", cfg.overwrite, context);
    cfg.logLevel = json::string_or(json, "log_level", cfg.logLevel, context);
    cfg.logFile = json::string_or(json, "log_file", cfg.logFile, context);
    return cfg;
}

ContainerConfig ContainerConfig::load(const std::filesystem::path& path)
{
    return fromJson(json::load_json_file(path), path.string());
}

nlohmann::json ContainerConfig::toJson() const
{
    nlohmann::json j;
    j["sync_mode"] = toString(syncMode);
    j["prefer_existing_types"] = preferExistingTypes;
    j["replace_conflicting_types"] = replaceConflictingTypes;
    j["overwrite"] = overwrite;
    j["log_level"] = logLevel;
    if (!logFile.empty()) {
        j["log_file"] = logFile;
    }
    return j;
}

void ContainerConfig::applyLogging() const
{
    SetLogLevel(logLevel);
    if (!logFile.empty()) {
        AddLogFile(logFile);
    }
}

}  // namespace h5cx
