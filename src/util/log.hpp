#pragma once

/*
    Leveled console output.

        debug   shown with --debug; settings and skipped candidates
        note    shown with --verbose; pointer renderings, "ok" lines
        status  shown unless --quiet; one line per problem
        warn    always shown, on stderr; summaries and errors

    Messages are formatted with fmt and written one per line. A custom sink
    can be installed to capture the output.
*/

#include <fmt/format.h>

#include <functional>
#include <string>
#include <utility>

namespace checkfiles {

enum class LogLevel {
    kDebug,
    kNote,
    kStatus,
    kWarn,
};

enum class Verbosity {
    kQuiet,
    kNormal,
    kVerbose,
    kDebug,
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

class Log {
   public:
    explicit Log(Verbosity verbosity = Verbosity::kNormal);
    Log(Verbosity verbosity, LogSink sink);

    bool
    enabled(LogLevel level) const;

    void
    write(LogLevel level, const std::string& message);

    template <typename... Args>
    void
    debug(fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(LogLevel::kDebug)) {
            write(LogLevel::kDebug, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void
    note(fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(LogLevel::kNote)) {
            write(LogLevel::kNote, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void
    status(fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(LogLevel::kStatus)) {
            write(LogLevel::kStatus, fmt::format(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void
    warn(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::kWarn, fmt::format(format, std::forward<Args>(args)...));
    }

   private:
    Verbosity verbosity_;
    LogSink sink_;
};

}  // namespace checkfiles
