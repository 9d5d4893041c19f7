#pragma once
#include <optional>
#include <string>
#include <sys/types.h>

enum class Error {
    IndexOutOfRange,
    EmptyCommand,
    ScriptNotFound,
    UnknownCommandKind,
    LaunchFailure,
    PersistenceFailure,
    LoadRecoveredEmpty,
};

const char* error_name(Error e);

struct Result {
    std::optional<Error> error;
    std::string message;
    pid_t pid{-1};      // set by successful launches only

    bool ok() const { return !error; }
    explicit operator bool() const { return ok(); }

    static Result success(pid_t pid = -1);
    static Result failure(Error e, std::string message);
};
