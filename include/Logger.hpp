#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#ifndef LOGGER_HPP
#define LOGGER_HPP

enum class LogLevel { Trace, Debug, Info, Warn, Error };

/**
 * Logger - Per-connection log lines
 *
 * Each line is "<time> [<LEVEL>] [<clientID>]: <message>". Level threshold
 * and the optional log file are process-wide; writes from all loggers are
 * serialized.
 */
class Logger {
    public:
        explicit Logger(std::string clientID);

        static void setLevel(LogLevel level);
        static LogLevel level();
        static bool parseLevel(std::string_view name, LogLevel& out);

        // Empty path disables file output. Returns false if the file cannot be opened.
        static bool setLogFile(const std::string& path);

        template <typename... Args>
        void trace(fmt::format_string<Args...> format, Args&&... args) {
            write(LogLevel::Trace, format, std::forward<Args>(args)...);
        }
        template <typename... Args>
        void debug(fmt::format_string<Args...> format, Args&&... args) {
            write(LogLevel::Debug, format, std::forward<Args>(args)...);
        }
        template <typename... Args>
        void info(fmt::format_string<Args...> format, Args&&... args) {
            write(LogLevel::Info, format, std::forward<Args>(args)...);
        }
        template <typename... Args>
        void warn(fmt::format_string<Args...> format, Args&&... args) {
            write(LogLevel::Warn, format, std::forward<Args>(args)...);
        }
        template <typename... Args>
        void error(fmt::format_string<Args...> format, Args&&... args) {
            write(LogLevel::Error, format, std::forward<Args>(args)...);
        }

        void logRequest(std::string_view request); //Log the sanitized request line
        void logTunnelEstablished(std::string_view authority); //Log tunnel establishment
        void logTunnelClosed(std::string_view authority); //Log tunnel closure

        const std::string& id() const { return clientID; }

    private:
        std::string clientID;

        template <typename... Args>
        void write(LogLevel lvl, fmt::format_string<Args...> format, Args&&... args) {
            if (lvl < level()) {
                return;
            }
            emit(lvl, fmt::format(format, std::forward<Args>(args)...));
        }

        void emit(LogLevel lvl, const std::string& message);
        static std::string getTime();
};

#endif // LOGGER_HPP
