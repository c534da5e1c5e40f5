#pragma once

#include <reactivedom/reactive/CellCore.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace RD {

// Cells read during one recompute pass, in first-read order, without duplicates.
class ReadSet {
public:
    auto add(std::shared_ptr<CellCore> cell) -> void {
        if (!cell)
            return;
        if (seen_.insert(cell->id()).second)
            cells_.push_back(std::move(cell));
    }

    [[nodiscard]] auto contains(CellId id) const -> bool { return seen_.contains(id); }
    [[nodiscard]] auto cells() const noexcept -> std::vector<std::shared_ptr<CellCore>> const& { return cells_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return cells_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return cells_.empty(); }

private:
    std::vector<std::shared_ptr<CellCore>> cells_;
    phmap::flat_hash_set<CellId>           seen_;
};

/**
 * TrackingContext — per-thread stack of recording frames
 *
 * The top frame receives every tracked cell read. A null frame suspends
 * recording for the code running inside it (untracked). Frames are only
 * pushed and popped by TrackingScope, which restores the previous depth on
 * destruction, so an exception thrown by an evaluation cannot leave a stale
 * frame behind.
 */
class TrackingContext {
public:
    static auto current() -> TrackingContext&;

    [[nodiscard]] auto isRecording() const noexcept -> bool {
        return !frames_.empty() && frames_.back() != nullptr;
    }
    [[nodiscard]] auto depth() const noexcept -> std::size_t { return frames_.size(); }

    auto record(std::shared_ptr<CellCore> cell) -> void {
        if (isRecording())
            frames_.back()->add(std::move(cell));
    }

private:
    friend class TrackingScope;

    std::vector<ReadSet*> frames_;
};

class TrackingScope {
public:
    explicit TrackingScope(ReadSet* reads, TrackingContext& context = TrackingContext::current())
        : context_(context)
        , restoreDepth_(context.frames_.size()) {
        context_.frames_.push_back(reads);
    }

    ~TrackingScope() {
        context_.frames_.resize(restoreDepth_);
    }

    TrackingScope(TrackingScope const&)            = delete;
    TrackingScope& operator=(TrackingScope const&) = delete;

private:
    TrackingContext& context_;
    std::size_t      restoreDepth_;
};

// Run fn without recording any cell read as a dependency.
template <typename F>
auto untracked(F&& fn) -> decltype(auto) {
    TrackingScope scope(nullptr);
    return std::forward<F>(fn)();
}

} // namespace RD
