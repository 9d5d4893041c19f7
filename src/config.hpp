#pragma once
#include <filesystem>

namespace config {

// Per-user directory holding commands.json and the console history.
// CMDRUNNER_HOME, then $XDG_CONFIG_HOME/cmdrunner, then ~/.config/cmdrunner.
std::filesystem::path default_storage_dir();

std::filesystem::path commands_file(const std::filesystem::path& dir);
std::filesystem::path history_file(const std::filesystem::path& dir);

} // namespace config
