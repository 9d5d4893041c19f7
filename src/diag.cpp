#include "diag.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace diag {

static std::atomic<Level> g_level{Level::Info};
static std::mutex g_mu;
static std::ostream* g_out = nullptr;

void set_level(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

bool set_level_from_string(const std::string& name) {
    if (name == "info")  { set_level(Level::Info);  return true; }
    if (name == "warn")  { set_level(Level::Warn);  return true; }
    if (name == "error") { set_level(Level::Error); return true; }
    if (name == "off")   { set_level(Level::Off);   return true; }
    return false;
}

void set_stream(std::ostream* os) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_out = os;
}

static void emit(Level lvl, const char* tag, const char* label, const std::string& msg) {
    if (lvl < g_level.load()) return;
    std::lock_guard<std::mutex> lk(g_mu);
    std::ostream& os = g_out ? *g_out : std::cerr;
    os << "[" << tag << "] " << label << msg << "\n";
    os.flush();
}

void info(const char* tag, const std::string& msg)  { emit(Level::Info, tag, "", msg); }
void warn(const char* tag, const std::string& msg)  { emit(Level::Warn, tag, "warning: ", msg); }
void error(const char* tag, const std::string& msg) { emit(Level::Error, tag, "ERROR: ", msg); }

} // namespace diag
