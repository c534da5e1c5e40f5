#pragma once

#include <reactivedom/core/Error.hpp>

#include <cstddef>

namespace RD {

struct RuntimeOptions {
    // Cell passes a single flush may deliver before it gives up.
    std::size_t maxFlushIterations = 100'000;
    // Record cells and watchers in the CellRegistry for the graph inspector.
    bool inspectCells = false;

    /**
     * Reads REACTIVEDOM_MAX_FLUSH_ITERATIONS (positive integer) and
     * REACTIVEDOM_INSPECT (truthy unless 0/false/off/no). Unset variables
     * keep the defaults; an unparsable or zero limit is MalformedInput.
     */
    static auto fromEnvironment() -> Expected<RuntimeOptions>;
};

// Apply options to the calling thread's Scheduler and CellRegistry.
auto configureRuntime(RuntimeOptions const& options) -> void;

} // namespace RD
