#include "log.hpp"

#include <cstdio>

using namespace checkfiles;

namespace {

void
console_sink(LogLevel level, const std::string& message) {
    std::FILE* stream = level == LogLevel::kWarn ? stderr : stdout;
    fmt::print(stream, "{}\n", message);
}

}  // namespace

Log::Log(Verbosity verbosity) : Log(verbosity, console_sink) {
}

Log::Log(Verbosity verbosity, LogSink sink) : verbosity_(verbosity), sink_(std::move(sink)) {
}

bool
Log::enabled(LogLevel level) const {
    switch (level) {
        case LogLevel::kDebug:
            return verbosity_ == Verbosity::kDebug;
        case LogLevel::kNote:
            return verbosity_ == Verbosity::kVerbose || verbosity_ == Verbosity::kDebug;
        case LogLevel::kStatus:
            return verbosity_ != Verbosity::kQuiet;
        case LogLevel::kWarn:
            return true;
    }
    return true;
}

void
Log::write(LogLevel level, const std::string& message) {
    if (!enabled(level) || !sink_) {
        return;
    }
    sink_(level, message);
}
