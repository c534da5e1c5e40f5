#pragma once

#include <reactivedom/reactive/CellCore.hpp>

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace RD {

using WatcherId = std::uint64_t;

struct CellRecord {
    CellId                                id = 0;
    CellCore::Kind                        kind = CellCore::Kind::Source;
    std::string                           label;
    std::chrono::system_clock::time_point createdAt;
    std::uint64_t                         reads  = 0;
    std::uint64_t                         writes = 0;
    std::vector<CellId>                   dependencies;
    std::weak_ptr<CellCore>               cell;
};

struct WatcherRecord {
    WatcherId                             id = 0;
    std::string                           label;
    std::chrono::system_clock::time_point createdAt;
    std::uint64_t                         triggers = 0;
    std::vector<CellId>                   dependencies;
};

/**
 * CellRegistry — instrumentation side table keyed by cell id
 *
 * Holds metadata for live cells and effect watchers without extending their
 * lifetime: records keep a weak_ptr only and are erased explicitly when the
 * cell is destroyed or the watcher is cleaned up. Recording is off unless
 * enabled (RuntimeOptions::inspectCells or setEnabled); cells created while
 * it is off are never recorded.
 */
class CellRegistry {
public:
    CellRegistry()  = default;
    ~CellRegistry() = default;

    CellRegistry(CellRegistry const&)            = delete;
    CellRegistry& operator=(CellRegistry const&) = delete;

    static auto current() -> CellRegistry&;
    // False once the current thread's registry has been torn down.
    static auto available() noexcept -> bool;

    auto setEnabled(bool enabled) noexcept -> void { enabled_ = enabled; }
    [[nodiscard]] auto enabled() const noexcept -> bool { return enabled_; }

    auto track(std::shared_ptr<CellCore> const& cell) -> void;
    auto forget(CellId id) -> void;
    auto noteRead(CellId id) -> void;
    auto noteWrite(CellId id) -> void;
    auto setLabel(CellId id, std::string const& label) -> void;
    auto setDependencies(CellId id, std::vector<CellId> dependencies) -> void;

    [[nodiscard]] auto registerWatcher(std::string label, std::vector<CellId> dependencies) -> WatcherId;
    auto noteWatcherTriggered(WatcherId id) -> void;
    auto unregisterWatcher(WatcherId id) -> void;

    [[nodiscard]] auto contains(CellId id) const -> bool { return cells_.contains(id); }
    [[nodiscard]] auto find(CellId id) const -> CellRecord const*;
    [[nodiscard]] auto cells() const -> std::vector<CellRecord>;
    [[nodiscard]] auto watchers() const -> std::vector<WatcherRecord>;
    [[nodiscard]] auto cellCount() const noexcept -> std::size_t { return cells_.size(); }
    [[nodiscard]] auto watcherCount() const noexcept -> std::size_t { return watchers_.size(); }

    auto clear() -> void;

private:
    phmap::flat_hash_map<CellId, CellRecord>       cells_;
    phmap::flat_hash_map<WatcherId, WatcherRecord> watchers_;
    WatcherId                                      nextWatcherId_ = 1;
    bool                                           enabled_       = false;
};

} // namespace RD
