#pragma once

#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <utility>

namespace h5cx
{

enum class LogLevel { Debug, Info, Warn, Error, Off };

class LoggerImpl;

/**
 * @brief Process-wide logger writing timestamped lines to stdout and to
 * any number of file sinks.
 *
 * Messages use std::format syntax:
 * @code
 * Logger()->info("committed compound type {} ({} bytes)", name, size);
 * @endcode
 */
class MinimalLogger
{
public:
    MinimalLogger();
    ~MinimalLogger();

    MinimalLogger(const MinimalLogger&) = delete;
    MinimalLogger& operator=(const MinimalLogger&) = delete;

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(LogLevel::Debug)) {
            write_log(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(LogLevel::Info)) {
            write_log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(LogLevel::Warn)) {
            write_log(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(LogLevel::Error)) {
            write_log(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    void set_level(LogLevel level);
    LogLevel level() const { return current_level_; }
    bool enabled(LogLevel level) const { return level >= current_level_; }

    void add_file(const std::filesystem::path& path);

private:
    static const char* level_string(LogLevel level);
    void write_log(LogLevel level, const std::string& msg);

    LogLevel current_level_;
    std::unique_ptr<LoggerImpl> impl_;
};

void AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
auto Logger() -> std::shared_ptr<MinimalLogger>;

}  // namespace h5cx
