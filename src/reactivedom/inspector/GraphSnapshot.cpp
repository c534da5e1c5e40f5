#include <reactivedom/inspector/GraphSnapshot.hpp>
#include <reactivedom/reactive/CellRegistry.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include <parallel_hashmap/phmap.h>

#include "nlohmann/json.hpp"

namespace RD::Inspector {
namespace {

[[nodiscard]] auto truncate_summary(std::string_view value, std::size_t limit) -> std::string {
    if (value.size() <= limit)
        return std::string{value};
    std::string truncated;
    truncated.reserve(limit + 3);
    truncated.append(value.substr(0, limit));
    truncated.append("...");
    return truncated;
}

[[nodiscard]] auto options_json(GraphSnapshotOptions const& options) -> nlohmann::json {
    return nlohmann::json{
        {"include_values", options.include_values},
        {"include_watchers", options.include_watchers},
        {"max_value_length", options.max_value_length},
    };
}

[[nodiscard]] auto to_json(GraphCellSummary const& cell) -> nlohmann::json {
    return nlohmann::json{
        {"id", cell.id},
        {"kind", cell.kind},
        {"label", cell.label},
        {"value_summary", cell.value_summary},
        {"subscriber_count", cell.subscriber_count},
        {"reads", cell.reads},
        {"writes", cell.writes},
        {"dependencies", cell.dependencies},
    };
}

[[nodiscard]] auto to_json(GraphWatcherSummary const& watcher) -> nlohmann::json {
    return nlohmann::json{
        {"id", watcher.id},
        {"label", watcher.label},
        {"triggers", watcher.triggers},
        {"dependencies", watcher.dependencies},
    };
}

[[nodiscard]] auto to_json(GraphEdge const& edge) -> nlohmann::json {
    return nlohmann::json{
        {"from", edge.from},
        {"to", edge.to},
        {"to_watcher", edge.to_watcher},
    };
}

[[nodiscard]] auto ids_from_json(nlohmann::json const& json, char const* what) -> Expected<std::vector<std::uint64_t>> {
    if (!json.is_array())
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{what} + " must be an array"});
    std::vector<std::uint64_t> ids;
    ids.reserve(json.size());
    for (auto const& entry : json) {
        if (!entry.is_number_unsigned())
            return std::unexpected(Error{Error::Code::MalformedInput, std::string{what} + " entries must be cell ids"});
        ids.push_back(entry.get<std::uint64_t>());
    }
    return ids;
}

[[nodiscard]] auto cell_from_json(nlohmann::json const& json) -> Expected<GraphCellSummary> {
    if (!json.is_object() || !json.contains("id") || !json["id"].is_number_unsigned())
        return std::unexpected(Error{Error::Code::MalformedInput, "graph cell must be an object with an id"});
    GraphCellSummary cell;
    cell.id               = json["id"].get<std::uint64_t>();
    cell.kind             = json.value("kind", std::string{"source"});
    cell.label            = json.value("label", std::string{});
    cell.value_summary    = json.value("value_summary", std::string{});
    cell.subscriber_count = json.value("subscriber_count", std::size_t{0});
    cell.reads            = json.value("reads", std::uint64_t{0});
    cell.writes           = json.value("writes", std::uint64_t{0});
    if (auto it = json.find("dependencies"); it != json.end()) {
        auto dependencies = ids_from_json(*it, "graph cell dependencies");
        if (!dependencies)
            return std::unexpected(dependencies.error());
        cell.dependencies = std::move(*dependencies);
    }
    return cell;
}

[[nodiscard]] auto watcher_from_json(nlohmann::json const& json) -> Expected<GraphWatcherSummary> {
    if (!json.is_object() || !json.contains("id") || !json["id"].is_number_unsigned())
        return std::unexpected(Error{Error::Code::MalformedInput, "graph watcher must be an object with an id"});
    GraphWatcherSummary watcher;
    watcher.id       = json["id"].get<std::uint64_t>();
    watcher.label    = json.value("label", std::string{});
    watcher.triggers = json.value("triggers", std::uint64_t{0});
    if (auto it = json.find("dependencies"); it != json.end()) {
        auto dependencies = ids_from_json(*it, "graph watcher dependencies");
        if (!dependencies)
            return std::unexpected(dependencies.error());
        watcher.dependencies = std::move(*dependencies);
    }
    return watcher;
}

[[nodiscard]] auto edge_from_json(nlohmann::json const& json) -> Expected<GraphEdge> {
    if (!json.is_object() || !json.contains("from") || !json.contains("to") || !json["from"].is_number_unsigned()
        || !json["to"].is_number_unsigned())
        return std::unexpected(Error{Error::Code::MalformedInput, "graph edge needs numeric from and to"});
    GraphEdge edge;
    edge.from       = json["from"].get<std::uint64_t>();
    edge.to         = json["to"].get<std::uint64_t>();
    edge.to_watcher = json.value("to_watcher", false);
    return edge;
}

template <typename T, typename Parse>
[[nodiscard]] auto parse_list(nlohmann::json const& json, char const* key, Parse parse) -> Expected<std::vector<T>> {
    std::vector<T> out;
    auto           it = json.find(key);
    if (it == json.end())
        return out;
    if (!it->is_array())
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"graph snapshot "} + key + " must be an array"});
    out.reserve(it->size());
    for (auto const& entry : *it) {
        auto parsed = parse(entry);
        if (!parsed)
            return std::unexpected(parsed.error());
        out.push_back(std::move(*parsed));
    }
    return out;
}

} // namespace

auto BuildGraphSnapshot(CellRegistry const& registry, GraphSnapshotOptions const& options) -> GraphSnapshot {
    GraphSnapshot snapshot;
    snapshot.options = options;

    phmap::flat_hash_set<std::uint64_t> dependedOn;
    for (auto const& record : registry.cells()) {
        auto cell = record.cell.lock();
        if (!cell) {
            snapshot.diagnostics.push_back("cell " + std::to_string(record.id) + " expired before its record was removed");
            continue;
        }
        GraphCellSummary summary;
        summary.id               = record.id;
        summary.kind             = cellKindToString(record.kind);
        summary.label            = record.label;
        summary.subscriber_count = cell->subscriberCount();
        summary.reads            = record.reads;
        summary.writes           = record.writes;
        summary.dependencies     = record.dependencies;
        if (options.include_values) {
            if (auto text = cell->describeValue())
                summary.value_summary = truncate_summary(*text, options.max_value_length);
        }
        for (auto dependency : record.dependencies) {
            dependedOn.insert(dependency);
            snapshot.edges.push_back(GraphEdge{dependency, record.id, false});
        }
        snapshot.cells.push_back(std::move(summary));
    }

    for (auto const& record : registry.watchers()) {
        for (auto dependency : record.dependencies)
            dependedOn.insert(dependency);
        if (!options.include_watchers)
            continue;
        for (auto dependency : record.dependencies)
            snapshot.edges.push_back(GraphEdge{dependency, record.id, true});
        snapshot.watchers.push_back(GraphWatcherSummary{record.id, record.label, record.triggers, record.dependencies});
    }

    for (auto const& cell : snapshot.cells) {
        if (cell.subscriber_count == 0 && !dependedOn.contains(cell.id))
            snapshot.orphans.push_back(cell.id);
    }
    return snapshot;
}

auto SerializeGraphSnapshot(GraphSnapshot const& snapshot, int indent) -> std::string {
    nlohmann::json cells    = nlohmann::json::array();
    nlohmann::json watchers = nlohmann::json::array();
    nlohmann::json edges    = nlohmann::json::array();
    for (auto const& cell : snapshot.cells)
        cells.push_back(to_json(cell));
    for (auto const& watcher : snapshot.watchers)
        watchers.push_back(to_json(watcher));
    for (auto const& edge : snapshot.edges)
        edges.push_back(to_json(edge));

    nlohmann::json json{
        {"options", options_json(snapshot.options)},
        {"cells", std::move(cells)},
        {"watchers", std::move(watchers)},
        {"edges", std::move(edges)},
        {"orphans", snapshot.orphans},
        {"diagnostics", snapshot.diagnostics},
    };
    return json.dump(indent);
}

namespace {

// json.value() throws type_error for a present key of the wrong type; the caller maps that to MalformedInput.
[[nodiscard]] auto snapshot_from_json(nlohmann::json const& json) -> Expected<GraphSnapshot> {
    GraphSnapshot snapshot;
    if (auto it = json.find("options"); it != json.end()) {
        if (!it->is_object())
            return std::unexpected(Error{Error::Code::MalformedInput, "graph snapshot options must be an object"});
        snapshot.options.include_values   = it->value("include_values", true);
        snapshot.options.include_watchers = it->value("include_watchers", true);
        snapshot.options.max_value_length = it->value("max_value_length", std::size_t{96});
    }

    auto cells = parse_list<GraphCellSummary>(json, "cells", cell_from_json);
    if (!cells)
        return std::unexpected(cells.error());
    auto watchers = parse_list<GraphWatcherSummary>(json, "watchers", watcher_from_json);
    if (!watchers)
        return std::unexpected(watchers.error());
    auto edges = parse_list<GraphEdge>(json, "edges", edge_from_json);
    if (!edges)
        return std::unexpected(edges.error());

    if (auto it = json.find("orphans"); it != json.end()) {
        auto orphans = ids_from_json(*it, "graph snapshot orphans");
        if (!orphans)
            return std::unexpected(orphans.error());
        snapshot.orphans = std::move(*orphans);
    }
    if (auto it = json.find("diagnostics"); it != json.end()) {
        if (!it->is_array())
            return std::unexpected(Error{Error::Code::MalformedInput, "graph snapshot diagnostics must be an array"});
        for (auto const& entry : *it) {
            if (!entry.is_string())
                return std::unexpected(Error{Error::Code::MalformedInput, "graph diagnostics entries must be strings"});
            snapshot.diagnostics.push_back(entry.get<std::string>());
        }
    }

    snapshot.cells    = std::move(*cells);
    snapshot.watchers = std::move(*watchers);
    snapshot.edges    = std::move(*edges);
    return snapshot;
}

} // namespace

auto ParseGraphSnapshot(std::string const& payload) -> Expected<GraphSnapshot> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded())
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid graph snapshot JSON"});
    if (!json.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "graph snapshot must be an object"});
    try {
        return snapshot_from_json(json);
    } catch (nlohmann::json::exception const& ex) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"graph snapshot field has the wrong type: "} + ex.what()});
    }
}

} // namespace RD::Inspector
