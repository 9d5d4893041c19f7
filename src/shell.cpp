#include "shell.hpp"
#include "diag.hpp"
#include "tokenizer.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iterator>
#include <poll.h>
#include <unistd.h>
#include <utility>

#include <readline/readline.h>
#include <readline/history.h>

static Shell* g_shell = nullptr;

static char** completion(const char* text, int start, int end);
static char* verb_generator(const char* text, int state);
static char* kind_generator(const char* text, int state);

static const char* const kVerbs[] = {
    "add", "capture", "desc", "down", "edit", "exit", "help", "list",
    "mv", "path", "rm", "run", "show", "try", "up",
};

static const char* const kKinds[] = { "single", "multi", "script" };

// ---------------------------------------------------------------- OutputQueue

OutputQueue::OutputQueue() : wake_(sys::make_pipe()) {
    sys::set_nonblock(wake_.r.get());
    sys::set_nonblock(wake_.w.get());
}

void OutputQueue::push(std::string text, bool is_error) {
    std::lock_guard<std::mutex> lk(mu_);
    const bool was_empty = chunks_.empty();
    chunks_.push_back(Chunk{std::move(text), is_error});
    if (!was_empty) return;   // a wake is already pending

    char b = 1;
    if (::write(wake_.w.get(), &b, 1) < 0 && errno != EAGAIN) {
        diag::warn("console", "wake pipe write failed: " + sys::errno_text(errno));
    }
}

std::vector<OutputQueue::Chunk> OutputQueue::take_all() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Chunk> out(std::make_move_iterator(chunks_.begin()),
                           std::make_move_iterator(chunks_.end()));
    chunks_.clear();
    return out;
}

void OutputQueue::clear_wake() {
    char buf[64];
    while (::read(wake_.r.get(), buf, sizeof buf) > 0) {}
}

// ---------------------------------------------------------------- helpers

static std::optional<long> parse_index(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v <= 0) return std::nullopt;
    return v - 1;   // console numbers from 1
}

static void report(const Result& r) {
    if (r.ok()) return;
    std::cerr << "error: " << error_name(*r.error) << ": " << r.message << "\n";
}

static std::string unescape_newlines(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == 'n') { out.push_back('\n'); ++i; }
        else out.push_back(s[i]);
    }
    return out;
}

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

static void on_line(char* input) {
    if (!input) {
        // Ctrl-D (EOF)
        std::cout << "\n";
        g_shell->quit();
        return;
    }
    std::string line(input);
    std::free(input);
    g_shell->handle_line(line);
}

// ---------------------------------------------------------------- Shell

Shell::Shell(ExecutionEngine& engine, std::filesystem::path history_path, bool capture)
    : engine_(engine), history_path_(std::move(history_path)),
      queue_(std::make_shared<OutputQueue>()) {
    set_capture(capture);
}

Shell::~Shell() {
    engine_.set_output_sink(nullptr);
    engine_.set_error_sink(nullptr);
}

void Shell::install_signal_handlers() {
    // Ctrl-C / Ctrl-\ should not take the console down; children reset these.
    ::signal(SIGINT, SIG_IGN);
    ::signal(SIGQUIT, SIG_IGN);
}

std::string Shell::prompt() const {
    // readline needs non-printing sequences wrapped in \001 and \002
    const std::string BLUE  = "\001\033[1;34m\002";
    const std::string RESET = "\001\033[0m\002";

    if (draft_) {
        if (draft_->kind == CommandKind::Multi) return BLUE + "...> " + RESET;
        return BLUE + (draft_->kind == CommandKind::Script ? "path> " : "command> ") + RESET;
    }
    return BLUE + "cmdrunner" + RESET + " > ";
}

void Shell::refresh_prompt() {
    if (!interactive_) return;
    rl_set_prompt(prompt().c_str());
}

void Shell::set_capture(bool on) {
    capture_ = on;
    if (on) {
        std::shared_ptr<OutputQueue> q = queue_;
        engine_.set_output_sink([q](const std::string& s) { q->push(s, false); });
        engine_.set_error_sink([q](const std::string& s) { q->push(s, true); });
    } else {
        engine_.set_output_sink(nullptr);
        engine_.set_error_sink(nullptr);
    }
}

// Returns true when the last chunk ended a line.
bool Shell::print_pending() {
    bool at_line_start = true;
    for (const auto& c : queue_->take_all()) {
        std::ostream& os = c.is_error ? std::cerr : std::cout;
        os << c.text;
        os.flush();
        if (!c.text.empty()) at_line_start = c.text.back() == '\n';
    }
    return at_line_start;
}

// Prints queued output above the line being edited, then puts it back.
void Shell::flush_output() {
    char* saved = rl_copy_text(0, rl_end);
    int saved_point = rl_point;
    rl_set_prompt("");
    rl_replace_line("", 0);
    rl_redisplay();

    if (!print_pending()) std::cout << "\n";
    std::cout.flush();

    refresh_prompt();
    rl_replace_line(saved ? saved : "", 0);
    rl_point = saved_point;
    rl_redisplay();
    std::free(saved);
}

void Shell::print_help() const {
    std::cout <<
        "  list                         show all commands\n"
        "  show N                       show command N in full\n"
        "  run N  |  N                  run command N\n"
        "  add KIND NAME [DESCRIPTION]  new command, then enter its content\n"
        "  edit N [KIND] [NAME]         re-enter content (empty line keeps it)\n"
        "  desc N TEXT                  set the description\n"
        "  rm N                         delete command N\n"
        "  mv FROM TO                   move a command\n"
        "  up N | down N                move by one\n"
        "  try KIND CONTENT             run without saving (\\n splits multi)\n"
        "  capture on|off               show output here or let it go to the terminal\n"
        "  path                         where commands are stored\n"
        "  exit\n"
        "KIND is single, multi or script. multi content ends with a lone '.'\n";
}

void Shell::print_list() const {
    auto cmds = engine_.list();
    if (cmds.empty()) {
        std::cout << "No commands configured. Use 'add' to create one.\n";
        return;
    }
    for (size_t i = 0; i < cmds.size(); ++i) {
        const auto& c = cmds[i];
        std::cout << "[" << (i + 1) << "] " << c.name() << "  (" << c.type_tag() << ")";
        if (!c.description().empty()) std::cout << "  - " << c.description();
        std::cout << "\n";
    }
}

void Shell::print_show(long index) const {
    auto c = engine_.registry().at(index);
    if (!c) {
        std::cerr << "error: no command " << (index + 1) << "\n";
        return;
    }
    std::cout << "name:        " << c->name() << "\n"
              << "type:        " << c->type_tag() << "\n"
              << "description: " << c->description() << "\n"
              << "content:\n" << c->content() << "\n";
}

void Shell::run_index(long index) {
    Result r = engine_.execute_at(index);
    if (!print_pending()) std::cout << "\n";
    if (r) std::cout << "started (pid " << r.pid << ")\n";
    else report(r);
}

bool Shell::handle_line(const std::string& line) {
    if (draft_) {
        handle_draft_line(line);
    } else if (!is_blank(line)) {
        add_history(line.c_str());
        if (append_history(1, history_path_.c_str()) != 0) {
            diag::warn("history", "cannot append to " + history_path_.string());
        }
        try {
            if (!handle_command(line)) done_ = true;
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
        }
    }
    if (!done_) refresh_prompt();
    return !done_;
}

bool Shell::handle_command(const std::string& line) {
    auto words = tokenize(line);
    if (words.empty()) return true;

    const std::string& cmd = words[0].text;
    auto arg = [&](size_t i) -> std::string { return i < words.size() ? words[i].text : std::string(); };
    auto index_arg = [&](size_t i) -> std::optional<long> {
        auto v = parse_index(arg(i));
        if (!v) std::cerr << "error: expected a command number, got '" << arg(i) << "'\n";
        return v;
    };

    if (cmd == "exit" || cmd == "quit") return false;

    if (cmd == "help") { print_help(); return true; }
    if (cmd == "list" || cmd == "ls") { print_list(); return true; }
    if (cmd == "path") { std::cout << engine_.registry().file().string() << "\n"; return true; }

    if (parse_index(cmd)) { run_index(*parse_index(cmd)); return true; }

    if (cmd == "run") {
        if (auto i = index_arg(1)) run_index(*i);
        return true;
    }

    if (cmd == "show") {
        if (auto i = index_arg(1)) print_show(*i);
        return true;
    }

    if (cmd == "rm") {
        if (auto i = index_arg(1)) {
            Result r = engine_.remove(*i);
            if (r) std::cout << "deleted\n";
            else report(r);
        }
        return true;
    }

    if (cmd == "mv" || cmd == "up" || cmd == "down") {
        auto from = index_arg(1);
        if (!from) return true;
        long to = *from;
        if (cmd == "up") to = *from - 1;
        else if (cmd == "down") to = *from + 1;
        else if (auto t = index_arg(2)) to = *t;
        else return true;

        const long n = static_cast<long>(engine_.registry().size());
        if (cmd != "mv" && *from < n && (to < 0 || to >= n)) {
            std::cout << "already at the " << (cmd == "up" ? "top" : "bottom") << "\n";
            return true;
        }
        report(engine_.move(*from, to));
        return true;
    }

    if (cmd == "desc") {
        auto i = index_arg(1);
        if (!i) return true;
        auto c = engine_.registry().at(*i);
        if (!c) { std::cerr << "error: no command " << arg(1) << "\n"; return true; }
        auto kind = c->kind();
        if (!kind) { std::cerr << "error: unknown command type '" << c->type_tag() << "'\n"; return true; }
        report(engine_.update(*i, Command(c->name(), *kind, c->content(), remainder_after(line, words, 2))));
        return true;
    }

    if (cmd == "capture") {
        if (arg(1) == "on") set_capture(true);
        else if (arg(1) == "off") set_capture(false);
        else if (!arg(1).empty()) { std::cerr << "usage: capture on|off\n"; return true; }
        std::cout << "capture is " << (capture_ ? "on" : "off") << "\n";
        return true;
    }

    if (cmd == "try") {
        auto kind = parse_kind(arg(1));
        std::string content = remainder_after(line, words, 2);
        if (!kind || content.empty()) { std::cerr << "usage: try single|multi|script CONTENT\n"; return true; }
        if (*kind == CommandKind::Multi) content = unescape_newlines(content);
        Result r = engine_.execute(Command("try", *kind, content));
        if (!print_pending()) std::cout << "\n";
        if (r) std::cout << "started (pid " << r.pid << ")\n";
        else report(r);
        return true;
    }

    if (cmd == "add") {
        auto kind = parse_kind(arg(1));
        if (!kind || is_blank(arg(2))) {
            std::cerr << "usage: add single|multi|script NAME [DESCRIPTION]\n";
            return true;
        }
        Draft d;
        d.kind = *kind;
        d.name = arg(2);
        d.description = remainder_after(line, words, 3);
        draft_ = std::move(d);
        if (*kind == CommandKind::Multi) std::cout << "Enter commands, one per line; '.' alone ends.\n";
        return true;
    }

    if (cmd == "edit") {
        auto i = index_arg(1);
        if (!i) return true;
        auto c = engine_.registry().at(*i);
        if (!c) { std::cerr << "error: no command " << arg(1) << "\n"; return true; }

        Draft d;
        d.editing = true;
        d.index = *i;
        d.name = words.size() > 3 ? arg(3) : c->name();
        d.description = c->description();
        d.previous_content = c->content();
        if (words.size() > 2) {
            auto kind = parse_kind(arg(2));
            if (!kind) { std::cerr << "error: unknown kind '" << arg(2) << "'\n"; return true; }
            d.kind = *kind;
        } else if (c->kind()) {
            d.kind = *c->kind();
        }
        if (is_blank(d.name)) { std::cerr << "error: command name is required\n"; return true; }

        std::cout << "current content:\n" << c->content() << "\n";
        if (d.kind == CommandKind::Multi) std::cout << "Enter commands, one per line; '.' alone ends (or keeps).\n";
        draft_ = std::move(d);
        return true;
    }

    std::cerr << "unknown command '" << cmd << "', try 'help'\n";
    return true;
}

void Shell::handle_draft_line(const std::string& line) {
    Draft& d = *draft_;

    if (d.kind != CommandKind::Multi) {
        finish_draft(is_blank(line) && d.editing ? d.previous_content : line);
        return;
    }

    if (line != ".") {
        d.lines.push_back(line);
        return;
    }
    if (d.lines.empty() && d.editing) {
        finish_draft(d.previous_content);
        return;
    }
    std::string content;
    for (size_t i = 0; i < d.lines.size(); ++i) {
        if (i) content.push_back('\n');
        content += d.lines[i];
    }
    finish_draft(content);
}

void Shell::finish_draft(std::string content) {
    Draft d = std::move(*draft_);
    draft_.reset();

    if (is_blank(content)) {
        std::cerr << "error: command content is required, nothing saved\n";
        return;
    }

    Command c(d.name, d.kind, std::move(content), d.description);
    Result r = d.editing ? engine_.update(d.index, std::move(c)) : engine_.add(std::move(c));
    if (r) std::cout << "Command '" << d.name << "' saved\n";
    else report(r);
}

int Shell::run() {
    install_signal_handlers();

    g_shell = this;
    rl_attempted_completion_function = completion;
    using_history();
    stifle_history(1000);

    int err = read_history(history_path_.c_str());
    if (err == ENOENT) {
        // append_history() needs the file to exist
        err = write_history(history_path_.c_str());
    }
    if (err != 0) {
        diag::warn("history", "cannot use " + history_path_.string() + ": " + sys::errno_text(err));
    }

    std::cout << "cmdrunner - " << engine_.registry().size()
              << " command(s) loaded from " << engine_.registry().file().string()
              << "\nType 'help' for commands.\n";

    rl_callback_handler_install(prompt().c_str(), on_line);
    interactive_ = true;

    while (!done_) {
        pollfd fds[2] = {
            {STDIN_FILENO, POLLIN, 0},
            {queue_->wake_fd(), POLLIN, 0},
        };
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            std::perror("poll");
            break;
        }
        if (fds[1].revents & POLLIN) {
            queue_->clear_wake();
            flush_output();
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            rl_callback_read_char();
        }
    }

    rl_callback_handler_remove();
    interactive_ = false;
    print_pending();

    if (write_history(history_path_.c_str()) != 0) {
        diag::warn("history", "cannot write " + history_path_.string());
    }
    g_shell = nullptr;
    return 0;
}

// ---------------------------------------------------------------- completion

static char** completion(const char* text, int start, int /*end*/) {
    if (start == 0) return rl_completion_matches(text, verb_generator);

    // Second word of add/try is a kind
    std::string before(rl_line_buffer, static_cast<size_t>(start));
    std::vector<Word> words;
    try {
        words = tokenize(before);
    } catch (const std::exception&) {
        return nullptr;   // inside an open quote, let readline fall back to filenames
    }
    if (words.size() == 1 && (words[0].text == "add" || words[0].text == "try")) {
        return rl_completion_matches(text, kind_generator);
    }

    return rl_completion_matches(text, rl_filename_completion_function);
}

static char* table_generator(const char* const* table, size_t count, const char* text, int state) {
    static size_t index;
    if (state == 0) index = 0;
    const size_t len = std::strlen(text);
    while (index < count) {
        const char* cand = table[index++];
        if (std::strncmp(cand, text, len) == 0) return strdup(cand);
    }
    return nullptr;
}

static char* verb_generator(const char* text, int state) {
    return table_generator(kVerbs, sizeof kVerbs / sizeof kVerbs[0], text, state);
}

static char* kind_generator(const char* text, int state) {
    return table_generator(kKinds, sizeof kKinds / sizeof kKinds[0], text, state);
}
