#include "h5cx/core/util/Logging.hpp"

#include "h5cx/core/util/Errors.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace h5cx
{

class LoggerImpl
{
public:
    std::mutex mutex;
    std::vector<std::shared_ptr<std::ofstream>> file_sinks;

    std::string get_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm;
        localtime_r(&time_t, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

MinimalLogger::MinimalLogger()
    : current_level_(LogLevel::Info)
    , impl_(std::make_unique<LoggerImpl>())
{
}

MinimalLogger::~MinimalLogger() = default;

const char* MinimalLogger::level_string(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "?????";
    }
}

void MinimalLogger::write_log(LogLevel level, const std::string& msg)
{
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::string formatted = std::format(
        "[{}] [{}] [h5cx] {}", impl_->get_timestamp(), level_string(level), msg);

    std::cout << formatted << std::endl;

    for (auto& file : impl_->file_sinks) {
        if (file && file->is_open()) {
            (*file) << formatted << std::endl;
            file->flush();
        }
    }
}

void MinimalLogger::set_level(LogLevel level)
{
    current_level_ = level;
}

void MinimalLogger::add_file(const std::filesystem::path& path)
{
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto file = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        throw ConfigError("cannot open log file: " + path.string());
    }
    impl_->file_sinks.push_back(file);
}

auto Logger() -> std::shared_ptr<MinimalLogger>
{
    static auto logger = std::make_shared<MinimalLogger>();
    return logger;
}

void AddLogFile(const std::filesystem::path& path)
{
    Logger()->add_file(path);
}

void SetLogLevel(const std::string& s)
{
    LogLevel level;

    if (s == "debug" || s == "DEBUG") {
        level = LogLevel::Debug;
    } else if (s == "info" || s == "INFO") {
        level = LogLevel::Info;
    } else if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING") {
        level = LogLevel::Warn;
    } else if (s == "error" || s == "ERROR") {
        level = LogLevel::Error;
    } else if (s == "off" || s == "OFF") {
        level = LogLevel::Off;
    } else {
        throw ConfigError("unknown log level: " + s);
    }

    Logger()->set_level(level);
}

}  // namespace h5cx
