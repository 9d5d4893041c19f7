#pragma once
#include "command.hpp"
#include "result.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

// Ordered, index-addressed collection of Commands backed by
// <dir>/commands.json. Every mutation is written out before it returns.
// Not thread-safe: callers serialize mutations.
class CommandRegistry {
public:
    // Creates dir if needed and loads eagerly.
    explicit CommandRegistry(std::filesystem::path dir);

    // Missing file -> empty, ok. Unparseable -> empty, LoadRecoveredEmpty.
    Result load();
    const Result& load_status() const { return load_status_; }

    std::vector<Command> list() const { return commands_; }
    size_t size() const { return commands_.size(); }
    std::optional<Command> at(long index) const;

    Result add(Command cmd);
    Result update(long index, Command cmd);
    Result remove(long index);
    // Pop at `from`, insert at `to` in the shortened sequence.
    // Both indices are checked against the current size.
    Result move(long from, long to);

    Result save() const;

    const std::filesystem::path& dir() const { return dir_; }
    const std::filesystem::path& file() const { return file_; }

private:
    bool in_range(long index) const;
    Result out_of_range(long index) const;

    std::filesystem::path dir_;
    std::filesystem::path file_;
    std::vector<Command> commands_;
    Result load_status_;
};
