#include "Logger.hpp"
#include "HTTPUtils.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>

#include <fmt/chrono.h>

// Serialize concurrent writes across all Logger instances
static std::mutex g_log_mutex;
static std::ofstream g_log_file;
static std::atomic<LogLevel> g_level{LogLevel::Info};

static std::string_view levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

// Create a new logger object for the given client
Logger::Logger(std::string clientID) : clientID(std::move(clientID)) {}

void Logger::setLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel Logger::level() {
    return g_level.load();
}

bool Logger::parseLevel(std::string_view name, LogLevel& out) {
    for (LogLevel candidate : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error}) {
        std::string_view upper = levelName(candidate);
        if (name.size() == upper.size() &&
            std::equal(name.begin(), name.end(), upper.begin(),
                       [](char a, char b) { return std::toupper(static_cast<unsigned char>(a)) == b; })) {
            out = candidate;
            return true;
        }
    }
    return false;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file.close();
    }
    if (path.empty()) {
        return true;
    }
    g_log_file.open(path, std::ios::app); //Open in append mode
    return g_log_file.is_open();
}

std::string Logger::getTime() {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

void Logger::logRequest(std::string_view request) {
    info("Request: {}", http_utils::sanitizeForLog(request));
}

void Logger::logTunnelEstablished(std::string_view authority) {
    info("Tunnel established to {}", authority);
}

void Logger::logTunnelClosed(std::string_view authority) {
    debug("Tunnel closed for {}", authority);
}

void Logger::emit(LogLevel lvl, const std::string& message) {
    std::string line = fmt::format("{} [{}] [{}]: {}", getTime(), levelName(lvl), clientID, message);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& console = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
    console << line << '\n';
    if (g_log_file.is_open()) {
        g_log_file << line << '\n';
        g_log_file.flush();
    }
}
