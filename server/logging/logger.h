#pragma once

#include <string>

namespace blockpipe {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line).
// Default mode is plain text: "[LEVEL] component: message".
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped before formatting. Default INFO.
void SetLevel(Level level);
Level GetLevel();
// Accepts debug/info/warn/warning/error in any case; unknown names map to
// INFO.
Level ParseLevel(const std::string &name);

// Mirror every entry to `path` (append mode) in addition to stderr. An empty
// path closes the file sink. Returns false when the file cannot be opened.
bool SetLogFile(const std::string &path);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "pipeline", "warm_cache", "scheduler").  `extra` is an optional
// key=value string appended to the JSON object or the text line.
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace blockpipe
