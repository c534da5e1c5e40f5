#pragma once

#include <reactivedom/core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace RD {

class CellRegistry;

namespace Inspector {

struct GraphSnapshotOptions {
    bool        include_values   = true;
    bool        include_watchers = true;
    std::size_t max_value_length = 96;
};

struct GraphCellSummary {
    std::uint64_t              id = 0;
    std::string                kind;
    std::string                label;
    std::string                value_summary;
    std::size_t                subscriber_count = 0;
    std::uint64_t              reads            = 0;
    std::uint64_t              writes           = 0;
    std::vector<std::uint64_t> dependencies;
};

// Data flows from `from` (a dependency) to `to` (the derived cell or watcher).
struct GraphEdge {
    std::uint64_t from = 0;
    std::uint64_t to   = 0;
    bool          to_watcher = false;
};

struct GraphWatcherSummary {
    std::uint64_t              id = 0;
    std::string                label;
    std::uint64_t              triggers = 0;
    std::vector<std::uint64_t> dependencies;
};

struct GraphSnapshot {
    GraphSnapshotOptions             options;
    std::vector<GraphCellSummary>    cells;
    std::vector<GraphWatcherSummary> watchers;
    std::vector<GraphEdge>           edges;
    // Cells with no subscribers that no recorded cell or watcher depends on.
    std::vector<std::uint64_t>       orphans;
    std::vector<std::string>         diagnostics;
};

auto BuildGraphSnapshot(CellRegistry const& registry,
                        GraphSnapshotOptions const& options = {}) -> GraphSnapshot;

auto SerializeGraphSnapshot(GraphSnapshot const& snapshot, int indent = 2) -> std::string;

auto ParseGraphSnapshot(std::string const& payload) -> Expected<GraphSnapshot>;

} // namespace Inspector
} // namespace RD
