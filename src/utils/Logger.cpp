#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <cstdio>

namespace TableScrape {

LogLevel Logger::level_ = LogLevel::Info;
guint Logger::handlerId_ = 0;

void Logger::init(LogLevel level) {
    level_ = level;
    if (handlerId_ != 0) return;
    handlerId_ = g_log_set_handler(G_LOG_DOMAIN,
                                   static_cast<GLogLevelFlags>(G_LOG_LEVEL_MASK | G_LOG_FLAG_FATAL |
                                                               G_LOG_FLAG_RECURSION),
                                   handler, nullptr);
}

void Logger::setLevel(LogLevel level) { level_ = level; }
LogLevel Logger::getLevel() { return level_; }

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lower = toLower(trim(name));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return fallback;
}

const char* Logger::levelName(GLogLevelFlags flags) {
    if (flags & G_LOG_LEVEL_ERROR) return "ERROR";
    if (flags & G_LOG_LEVEL_CRITICAL) return "ERROR";
    if (flags & G_LOG_LEVEL_WARNING) return "WARNING";
    if (flags & (G_LOG_LEVEL_MESSAGE | G_LOG_LEVEL_INFO)) return "INFO";
    return "DEBUG";
}

bool Logger::isEnabled(GLogLevelFlags flags) {
    switch (level_) {
    case LogLevel::Debug:
        return true;
    case LogLevel::Info:
        return (flags & G_LOG_LEVEL_DEBUG) == 0;
    case LogLevel::Warning:
        return (flags & (G_LOG_LEVEL_ERROR | G_LOG_LEVEL_CRITICAL | G_LOG_LEVEL_WARNING)) != 0;
    case LogLevel::Error:
        return (flags & (G_LOG_LEVEL_ERROR | G_LOG_LEVEL_CRITICAL)) != 0;
    }
    return true;
}

void Logger::handler(const gchar* /*domain*/, GLogLevelFlags flags, const gchar* message, gpointer /*userData*/) {
    if (!isEnabled(flags)) return;

    GDateTime* now = g_date_time_new_now_local();
    gchar* stamp = now ? g_date_time_format(now, "%Y-%m-%d %H:%M:%S") : nullptr;
    std::fprintf(stderr, "%s - %s - %s\n", stamp ? stamp : "", levelName(flags), message ? message : "");
    std::fflush(stderr);
    g_free(stamp);
    if (now) g_date_time_unref(now);
}

}
