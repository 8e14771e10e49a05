#include "logging.hpp"
#include <atomic>

extern "C" {
#include <libavutil/log.h>
}

namespace camrec {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    if (text == "debug") level = LogLevel::Debug;
    else if (text == "info") level = LogLevel::Info;
    else if (text == "warn") level = LogLevel::Warn;
    else if (text == "error") level = LogLevel::Error;
    else return false;
    return true;
}

void setLogLevel(LogLevel level) {
    g_level = static_cast<int>(level);
    av_log_set_level(level == LogLevel::Debug ? AV_LOG_INFO : AV_LOG_ERROR);
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

} // namespace camrec
