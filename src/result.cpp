#include "result.hpp"
#include <utility>

const char* error_name(Error e) {
    switch (e) {
    case Error::IndexOutOfRange:    return "IndexOutOfRange";
    case Error::EmptyCommand:       return "EmptyCommand";
    case Error::ScriptNotFound:     return "ScriptNotFound";
    case Error::UnknownCommandKind: return "UnknownCommandKind";
    case Error::LaunchFailure:      return "LaunchFailure";
    case Error::PersistenceFailure: return "PersistenceFailure";
    case Error::LoadRecoveredEmpty: return "LoadRecoveredEmpty";
    }
    return "?";
}

Result Result::success(pid_t pid) {
    Result r;
    r.pid = pid;
    return r;
}

Result Result::failure(Error e, std::string message) {
    Result r;
    r.error = e;
    r.message = std::move(message);
    return r;
}
