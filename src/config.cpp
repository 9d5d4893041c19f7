#include "config.hpp"
#include "diag.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace config {

static const char* non_empty_env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

fs::path default_storage_dir() {
    if (const char* home = non_empty_env("CMDRUNNER_HOME")) return fs::path(home);

    if (const char* xdg = non_empty_env("XDG_CONFIG_HOME")) return fs::path(xdg) / "cmdrunner";

    const char* home = non_empty_env("HOME");
    if (!home) {
        if (struct passwd* pw = ::getpwuid(::getuid())) home = pw->pw_dir;
    }
    if (home) return fs::path(home) / ".config" / "cmdrunner";

    diag::warn("config", "cannot resolve a home directory, falling back to ./.cmdrunner");
    return fs::path(".cmdrunner");
}

fs::path commands_file(const fs::path& dir) { return dir / "commands.json"; }

fs::path history_file(const fs::path& dir) { return dir / "history"; }

} // namespace config
