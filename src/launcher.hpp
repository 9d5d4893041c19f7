#pragma once
#include "command.hpp"
#include "result.hpp"

#include <string>
#include <vector>

struct LaunchPlan {
    std::vector<std::string> echo_lines;   // what the user sees before the run
    std::string shell_body;                // handed to /bin/sh -c
};

// Translates a command into its shell invocation without launching it.
// multi: lines are trimmed, blank ones dropped, the rest joined with '\n'
//        and run as one script body (EmptyCommand if none are left).
// script: ScriptNotFound if the path does not exist.
// UnknownCommandKind for a type tag that is not single/multi/script.
Result make_plan(const Command& cmd, LaunchPlan& plan);

struct LaunchRequest {
    std::string shell_body;
    std::string label;      // for logging
    int stdout_fd{-1};      // write end to install as fd 1; -1 inherits
    int stderr_fd{-1};      // write end to install as fd 2; -1 inherits
};

// Starts `/bin/sh -c body` in a new session with stdin on /dev/null.
// Returns once exec has been accepted; the child is never waited on.
// Result::pid is the child's pid. LaunchFailure carries the errno text.
Result launch_detached(const LaunchRequest& req);
