#include "coloc/core/util/Logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace coloc {

SimpleLogger::SimpleLogger() = default;

SimpleLogger::~SimpleLogger()
{
    for (auto& file : files_) {
        if (file.is_open()) {
            file.close();
        }
    }
}

void SimpleLogger::addFile(const std::filesystem::path& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + path.string());
    }
    files_.push_back(std::move(file));
}

void SimpleLogger::write(Level level, const std::string& msg)
{
    std::string prefix = levelPrefix(level);

    std::cerr << prefix << msg << std::endl;

    for (auto& file : files_) {
        if (file.is_open()) {
            file << prefix << msg << std::endl;
        }
    }
}

std::string SimpleLogger::levelPrefix(Level level)
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

    switch (level) {
        case Level::Trace:    oss << "[TRACE] "; break;
        case Level::Debug:    oss << "[DEBUG] "; break;
        case Level::Info:     oss << "[INFO] "; break;
        case Level::Warn:     oss << "[WARN] "; break;
        case Level::Error:    oss << "[ERROR] "; break;
        case Level::Critical: oss << "[CRITICAL] "; break;
        case Level::Off:      break;
    }

    return oss.str();
}

std::optional<SimpleLogger::Level> ParseLogLevel(const std::string& s)
{
    using Level = SimpleLogger::Level;
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info") return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error" || s == "err") return Level::Error;
    if (s == "critical" || s == "crit") return Level::Critical;
    if (s == "off") return Level::Off;
    return std::nullopt;
}

std::shared_ptr<SimpleLogger> Logger()
{
    static auto logger = std::make_shared<SimpleLogger>();
    return logger;
}

void AddLogFile(const std::filesystem::path& path)
{
    Logger()->addFile(path);
}

bool SetLogLevel(const std::string& s)
{
    auto level = ParseLogLevel(s);
    if (!level) {
        return false;
    }
    Logger()->setLevel(*level);
    return true;
}

}  // namespace coloc
