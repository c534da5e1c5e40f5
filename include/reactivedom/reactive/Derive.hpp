#pragma once

#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/CellRegistry.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>
#include <reactivedom/reactive/TrackingContext.hpp>

#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace RD {

namespace detail {

auto reportEvaluationFault(CellId cell, char const* what) -> void;
auto reportReentrantRecompute(CellId cell) -> void;

/**
 * TrackedComputation — dynamic dependency tracker behind derive(fn)
 *
 * Each pass evaluates under a fresh ReadSet frame and then reconciles the
 * subscriptions against the cells that pass actually read, so a cell read
 * only in a branch that is no longer taken stops triggering recomputes.
 *
 * Ownership: source subscriptions hold the computation, the computation
 * holds its result cell. Disposing the result cell releases every source
 * subscription.
 */
template <typename R, typename F>
class TrackedComputation : public std::enable_shared_from_this<TrackedComputation<R, F>> {
public:
    explicit TrackedComputation(F evaluate)
        : evaluate_(std::move(evaluate)) {}

    // First evaluation; exceptions propagate to the caller of derive().
    auto initialize() -> Cell<R> {
        ReadSet          reads;
        std::optional<R> value;
        {
            TrackingScope scope(&reads);
            value.emplace(std::invoke(evaluate_));
        }
        result_ = Cell<R>(std::move(*value), CellCore::Kind::Tracked);
        this->reconcile(reads, true);

        std::weak_ptr<TrackedComputation> weakSelf = this->weak_from_this();
        result_.core()->addDisposer(Cleanup([weakSelf]() {
            if (auto self = weakSelf.lock())
                self->release();
        }));
        return result_;
    }

    auto recompute() -> void {
        if (running_) {
            reportReentrantRecompute(result_.id());
            return;
        }
        struct RunningGuard {
            explicit RunningGuard(bool& flag) : flag_(flag) { flag_ = true; }
            ~RunningGuard() { flag_ = false; }
            bool& flag_;
        } guard(running_);

        // Keeps this alive if a reconcile drops the last subscription owning it.
        auto keepAlive = this->shared_from_this();

        ReadSet          reads;
        std::optional<R> value;
        try {
            TrackingScope scope(&reads);
            value.emplace(std::invoke(evaluate_));
        } catch (std::exception const& ex) {
            this->reconcile(reads, false);
            reportEvaluationFault(result_.id(), ex.what());
            return;
        }
        this->reconcile(reads, true);
        if (!shallowEqual(*value, result_.peek()))
            result_.set(std::move(*value));
    }

    auto release() -> void {
        auto subscriptions = std::move(subscriptions_);
        subscriptions_.clear();
        for (auto const& [id, cleanup] : subscriptions)
            cleanup();
    }

    [[nodiscard]] auto dependencyCount() const noexcept -> std::size_t { return subscriptions_.size(); }

private:
    // Subscribe to newly read cells; with prune, drop cells this pass did not read.
    auto reconcile(ReadSet const& reads, bool prune) -> void {
        auto const selfId = result_.valid() ? result_.id() : CellId{0};
        for (auto const& cell : reads.cells()) {
            if (cell->id() == selfId || subscriptions_.contains(cell->id()))
                continue;
            auto owner = this->shared_from_this();
            subscriptions_.emplace(cell->id(), cell->subscribeErased([owner]() { owner->recompute(); }));
        }
        if (prune) {
            std::vector<CellId> dropped;
            for (auto const& [id, cleanup] : subscriptions_) {
                if (!reads.contains(id))
                    dropped.push_back(id);
            }
            for (auto id : dropped) {
                auto it = subscriptions_.find(id);
                auto cleanup = std::move(it->second);
                subscriptions_.erase(it);
                cleanup();
            }
        }

        auto& registry = CellRegistry::current();
        if (registry.enabled() && result_.valid()) {
            std::vector<CellId> ids;
            for (auto const& [id, cleanup] : subscriptions_)
                ids.push_back(id);
            std::sort(ids.begin(), ids.end());
            registry.setDependencies(result_.id(), std::move(ids));
        }
    }

    F                                     evaluate_;
    Cell<R>                               result_;
    phmap::flat_hash_map<CellId, Cleanup> subscriptions_;
    bool                                  running_ = false;
};

} // namespace detail

/**
 * derive — cell computed from whatever cells evaluate() reads
 *
 * Dependencies are discovered on every pass, not declared. The result is
 * only written when it differs (shallowEqual) from the current value, so
 * downstream subscribers see no pass for an unchanged result.
 */
template <typename F>
    requires std::invocable<std::decay_t<F>&>
[[nodiscard]] auto derive(F&& evaluate) -> Cell<std::decay_t<std::invoke_result_t<std::decay_t<F>&>>> {
    using R = std::decay_t<std::invoke_result_t<std::decay_t<F>&>>;
    auto computation = std::make_shared<detail::TrackedComputation<R, std::decay_t<F>>>(std::forward<F>(evaluate));
    auto result      = computation->initialize();
    registerWithCurrentScope(Cleanup([core = result.core()]() { core->dispose(); }));
    return result;
}

} // namespace RD
