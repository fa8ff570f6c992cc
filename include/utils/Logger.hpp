#pragma once
#include <glib.h>
#include <string>

namespace TableScrape {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Routes the application's GLib log domain to stderr as
// "YYYY-MM-DD HH:MM:SS - LEVEL - message", dropping anything below the
// configured level.
class Logger {
public:
    static void init(LogLevel level);
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static LogLevel parseLevel(const std::string& name, LogLevel fallback);
    static const char* levelName(GLogLevelFlags flags);

private:
    static void handler(const gchar* domain, GLogLevelFlags flags, const gchar* message, gpointer userData);
    static bool isEnabled(GLogLevelFlags flags);

    static LogLevel level_;
    static guint handlerId_;
};

}
