#pragma once
#include <ostream>
#include <string>

// Tagged diagnostics on stderr: "[registry] Saved 3 commands".
namespace diag {

enum class Level { Info, Warn, Error, Off };

void set_level(Level lvl);
Level level();

// Accepts "info", "warn", "error", "off". Returns false and leaves the
// level untouched for anything else.
bool set_level_from_string(const std::string& name);

// Redirects output; tests point this at a stringstream. nullptr restores std::cerr.
void set_stream(std::ostream* os);

void info(const char* tag, const std::string& msg);
void warn(const char* tag, const std::string& msg);
void error(const char* tag, const std::string& msg);

} // namespace diag
