#pragma once
#include "command.hpp"
#include "registry.hpp"
#include "relay.hpp"
#include "result.hpp"

#include <mutex>
#include <utility>
#include <vector>

// Public surface for front ends: runs registry entries detached and relays
// their output to the registered sinks.
//
// Per run: Requested -> Launched -> (Streaming)* -> Detached. Nothing is
// observed after the launch returns; there is no completion state.
class ExecutionEngine {
public:
    explicit ExecutionEngine(CommandRegistry& registry) : registry_(registry) {}

    // An empty function clears the sink. Drains already running keep the
    // sink they started with.
    void set_output_sink(Sink sink);
    void set_error_sink(Sink sink);

    // With a sink registered its stream is captured; without one the child
    // inherits ours. Echo lines ("$ cmd") go to the output sink first.
    Result execute_at(long index);
    Result execute(const Command& cmd);

    std::vector<Command> list() const { return registry_.list(); }
    Result add(Command cmd) { return registry_.add(std::move(cmd)); }
    Result update(long index, Command cmd) { return registry_.update(index, std::move(cmd)); }
    Result remove(long index) { return registry_.remove(index); }
    Result move(long from, long to) { return registry_.move(from, to); }

    CommandRegistry& registry() { return registry_; }

private:
    CommandRegistry& registry_;
    mutable std::mutex sink_mu_;
    Sink out_;
    Sink err_;
};
