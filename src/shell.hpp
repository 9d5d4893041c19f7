#pragma once
#include "command.hpp"
#include "engine.hpp"
#include "sys.hpp"

#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Hands captured chunks from drain threads to the console thread. push()
// is thread-safe and pokes a pipe that the console polls.
class OutputQueue {
public:
    struct Chunk {
        std::string text;
        bool is_error{false};
    };

    OutputQueue();

    void push(std::string text, bool is_error);
    std::vector<Chunk> take_all();

    int wake_fd() const { return wake_.r.get(); }
    void clear_wake();

private:
    std::mutex mu_;
    std::deque<Chunk> chunks_;
    sys::Pipe wake_;
};

class Shell {
public:
    Shell(ExecutionEngine& engine, std::filesystem::path history_path, bool capture);
    ~Shell();
    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    int run();

    // Entry point for one console line; returns false on exit. Public so the
    // readline line handler can reach it.
    bool handle_line(const std::string& line);
    void quit() { done_ = true; }

private:
    struct Draft {
        bool editing{false};
        long index{-1};
        CommandKind kind{CommandKind::Single};
        std::string name;
        std::string description;
        std::string previous_content;
        std::vector<std::string> lines;
    };

    void install_signal_handlers();
    std::string prompt() const;
    void refresh_prompt();

    bool handle_command(const std::string& line);
    void handle_draft_line(const std::string& line);
    void finish_draft(std::string content);

    void print_help() const;
    void print_list() const;
    void print_show(long index) const;
    void run_index(long index);
    void set_capture(bool on);
    bool print_pending();
    void flush_output();

    ExecutionEngine& engine_;
    std::filesystem::path history_path_;
    // Shared with the engine's sinks, which drain threads may still hold
    // after the console is gone.
    std::shared_ptr<OutputQueue> queue_;
    std::optional<Draft> draft_;
    bool capture_{true};
    bool interactive_{false};
    bool done_{false};
};
