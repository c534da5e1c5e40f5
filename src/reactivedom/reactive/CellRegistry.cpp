#include <reactivedom/reactive/CellRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace RD {
namespace {

// Cells owned by other thread_local objects may outlive the registry at thread exit.
thread_local bool g_registryDestroyed = false;

struct RegistryHolder {
    CellRegistry registry;
    ~RegistryHolder() { g_registryDestroyed = true; }
};

} // namespace

auto CellRegistry::current() -> CellRegistry& {
    thread_local RegistryHolder holder;
    return holder.registry;
}

auto CellRegistry::available() noexcept -> bool {
    return !g_registryDestroyed;
}

auto CellRegistry::track(std::shared_ptr<CellCore> const& cell) -> void {
    if (!cell)
        return;
    CellRecord record;
    record.id        = cell->id();
    record.kind      = cell->kind();
    record.label     = cell->label();
    record.createdAt = std::chrono::system_clock::now();
    record.cell      = cell;
    cells_.insert_or_assign(record.id, std::move(record));
    rd_log("registry tracks cell " + std::to_string(cell->id()), "Registry");
}

auto CellRegistry::forget(CellId id) -> void {
    cells_.erase(id);
}

auto CellRegistry::noteRead(CellId id) -> void {
    if (auto it = cells_.find(id); it != cells_.end())
        ++it->second.reads;
}

auto CellRegistry::noteWrite(CellId id) -> void {
    if (auto it = cells_.find(id); it != cells_.end())
        ++it->second.writes;
}

auto CellRegistry::setLabel(CellId id, std::string const& label) -> void {
    if (auto it = cells_.find(id); it != cells_.end())
        it->second.label = label;
}

auto CellRegistry::setDependencies(CellId id, std::vector<CellId> dependencies) -> void {
    if (auto it = cells_.find(id); it != cells_.end())
        it->second.dependencies = std::move(dependencies);
}

auto CellRegistry::registerWatcher(std::string label, std::vector<CellId> dependencies) -> WatcherId {
    auto const id = nextWatcherId_++;
    WatcherRecord record;
    record.id           = id;
    record.label        = std::move(label);
    record.createdAt    = std::chrono::system_clock::now();
    record.dependencies = std::move(dependencies);
    watchers_.insert_or_assign(id, std::move(record));
    return id;
}

auto CellRegistry::noteWatcherTriggered(WatcherId id) -> void {
    if (auto it = watchers_.find(id); it != watchers_.end())
        ++it->second.triggers;
}

auto CellRegistry::unregisterWatcher(WatcherId id) -> void {
    watchers_.erase(id);
}

auto CellRegistry::find(CellId id) const -> CellRecord const* {
    auto it = cells_.find(id);
    return it == cells_.end() ? nullptr : &it->second;
}

auto CellRegistry::cells() const -> std::vector<CellRecord> {
    std::vector<CellRecord> out;
    out.reserve(cells_.size());
    for (auto const& [id, record] : cells_)
        out.push_back(record);
    std::sort(out.begin(), out.end(), [](CellRecord const& a, CellRecord const& b) { return a.id < b.id; });
    return out;
}

auto CellRegistry::watchers() const -> std::vector<WatcherRecord> {
    std::vector<WatcherRecord> out;
    out.reserve(watchers_.size());
    for (auto const& [id, record] : watchers_)
        out.push_back(record);
    std::sort(out.begin(), out.end(), [](WatcherRecord const& a, WatcherRecord const& b) { return a.id < b.id; });
    return out;
}

auto CellRegistry::clear() -> void {
    cells_.clear();
    watchers_.clear();
}

} // namespace RD
