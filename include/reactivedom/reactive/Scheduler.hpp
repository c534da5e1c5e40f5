#pragma once

#include <reactivedom/core/Error.hpp>
#include <reactivedom/reactive/CellCore.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace RD {

struct Fault {
    enum class Kind {
        Subscriber,
        Evaluation,
        Cleanup,
        Mount
    };

    Kind        kind;
    CellId      cell = 0;
    std::string message;
};

struct SchedulerStats {
    std::uint64_t flushes                = 0;
    std::uint64_t cellPasses             = 0;
    std::uint64_t notificationsDelivered = 0;
    std::uint64_t subscriberFaults       = 0;
    std::uint64_t evaluationFaults       = 0;
    std::uint64_t cleanupFaults          = 0;
    std::uint64_t mountFaults            = 0;
    std::uint64_t droppedPasses          = 0;
};

/**
 * Scheduler — per-thread notification queue
 *
 * Purpose
 * -------
 * Defers subscriber invocation to the next scheduler turn so that repeated
 * synchronous writes to a cell collapse into one pass carrying the final
 * value.
 *
 * Notes
 * -----
 * - A turn is a call to flush(). Hosts that own an event loop install a turn
 *   hook; it is invoked when the queue goes from empty to non-empty outside
 *   of a flush or batch, and should post a flush() to the loop.
 * - Cells scheduled during a flush are delivered by that same flush.
 * - flush() called from inside a subscriber returns 0 and leaves the work to
 *   the running flush.
 * - maxFlushIterations bounds the number of cell passes per flush; hitting
 *   it drops the remaining passes and returns CapacityExceeded.
 */
class Scheduler {
public:
    using TurnHook     = std::function<void()>;
    using FaultHandler = std::function<void(Fault const&)>;

    static constexpr std::size_t kDefaultMaxFlushIterations = 100'000;

    Scheduler()  = default;
    ~Scheduler() = default;

    Scheduler(Scheduler const&)            = delete;
    Scheduler& operator=(Scheduler const&) = delete;

    static auto current() -> Scheduler&;

    auto schedule(std::shared_ptr<CellCore> cell) -> void;
    auto flush() -> Expected<std::size_t>;

    template <typename F>
    auto batch(F&& fn) -> decltype(auto);

    [[nodiscard]] auto hasPending() const noexcept -> bool { return !queue_.empty(); }
    [[nodiscard]] auto pendingCount() const noexcept -> std::size_t { return queue_.size(); }
    [[nodiscard]] auto isFlushing() const noexcept -> bool { return flushing_; }
    [[nodiscard]] auto isBatching() const noexcept -> bool { return batchDepth_ > 0; }

    auto setTurnHook(TurnHook hook) -> void { turnHook_ = std::move(hook); }
    auto setFaultHandler(FaultHandler handler) -> void { faultHandler_ = std::move(handler); }
    auto setMaxFlushIterations(std::size_t limit) noexcept -> void { maxFlushIterations_ = limit; }
    [[nodiscard]] auto maxFlushIterations() const noexcept -> std::size_t { return maxFlushIterations_; }

    // Contained faults from subscribers, evaluations and cleanups land here.
    auto reportFault(Fault fault) -> void;

    [[nodiscard]] auto stats() const noexcept -> SchedulerStats const& { return stats_; }
    auto resetStats() noexcept -> void { stats_ = {}; }

    // Drop queued passes without delivering them.
    auto clear() -> void;

private:
    struct BatchGuard {
        explicit BatchGuard(Scheduler& scheduler) : scheduler_(scheduler) { ++scheduler_.batchDepth_; }
        ~BatchGuard() { scheduler_.endBatch(); }
        BatchGuard(BatchGuard const&)            = delete;
        BatchGuard& operator=(BatchGuard const&) = delete;

        Scheduler& scheduler_;
    };

    auto endBatch() -> void;

    std::deque<std::shared_ptr<CellCore>> queue_;
    TurnHook                              turnHook_;
    FaultHandler                          faultHandler_;
    std::size_t                           maxFlushIterations_ = kDefaultMaxFlushIterations;
    std::size_t                           batchDepth_         = 0;
    bool                                  flushing_           = false;
    SchedulerStats                        stats_;
};

template <typename F>
auto Scheduler::batch(F&& fn) -> decltype(auto) {
    BatchGuard guard(*this);
    return std::forward<F>(fn)();
}

// Drain the current thread's queue.
inline auto flush() -> Expected<std::size_t> {
    return Scheduler::current().flush();
}

// Run fn with notifications held back, then drain synchronously.
template <typename F>
auto batch(F&& fn) -> decltype(auto) {
    return Scheduler::current().batch(std::forward<F>(fn));
}

} // namespace RD
