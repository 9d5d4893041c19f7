#include "engine.hpp"
#include "diag.hpp"
#include "launcher.hpp"
#include "sys.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

static constexpr const char* TAG = "engine";

void ExecutionEngine::set_output_sink(Sink sink) {
    std::lock_guard<std::mutex> lk(sink_mu_);
    out_ = std::move(sink);
}

void ExecutionEngine::set_error_sink(Sink sink) {
    std::lock_guard<std::mutex> lk(sink_mu_);
    err_ = std::move(sink);
}

Result ExecutionEngine::execute_at(long index) {
    auto cmd = registry_.at(index);
    if (!cmd) {
        std::string msg = "Invalid command index: " + std::to_string(index);
        diag::error(TAG, msg);
        return Result::failure(Error::IndexOutOfRange, msg);
    }
    return execute(*cmd);
}

Result ExecutionEngine::execute(const Command& cmd) {
    diag::info(TAG, "Executing " + cmd.type_tag() + " command '" + cmd.name() + "'");

    LaunchPlan plan;
    Result planned = make_plan(cmd, plan);
    if (!planned) {
        diag::error(TAG, "Command '" + cmd.name() + "' refused: " + planned.message);
        return planned;
    }

    Sink out, err;
    {
        std::lock_guard<std::mutex> lk(sink_mu_);
        out = out_;
        err = err_;
    }

    if (out) {
        try {
            for (const auto& line : plan.echo_lines) out("$ " + line + "\n");
        } catch (const std::exception& e) {
            std::string msg = std::string("output sink threw: ") + e.what();
            diag::error(TAG, "Command '" + cmd.name() + "' not started, " + msg);
            return Result::failure(Error::LaunchFailure, msg);
        }
    }

    std::optional<sys::Pipe> out_pipe, err_pipe;
    try {
        if (out) out_pipe = sys::make_pipe();
        if (err) err_pipe = sys::make_pipe();
    } catch (const std::system_error& e) {
        diag::error(TAG, std::string("cannot capture output: ") + e.what());
        return Result::failure(Error::LaunchFailure, e.what());
    }

    LaunchRequest req;
    req.shell_body = plan.shell_body;
    req.label = cmd.name();
    req.stdout_fd = out_pipe ? out_pipe->w.get() : -1;
    req.stderr_fd = err_pipe ? err_pipe->w.get() : -1;

    Result launched = launch_detached(req);

    // Our copies of the write ends must go, or the drains never see EOF.
    if (out_pipe) out_pipe->w.reset();
    if (err_pipe) err_pipe->w.reset();

    if (!launched) return launched;

    // The child is running now; a relay that cannot start costs only output.
    try {
        if (out_pipe) drain(std::move(out_pipe->r), out, "stdout");
        if (err_pipe) drain(std::move(err_pipe->r), err, "stderr");
    } catch (const std::system_error& e) {
        diag::error(TAG, "cannot relay output of '" + cmd.name() + "': " + e.what());
    }
    return launched;
}
