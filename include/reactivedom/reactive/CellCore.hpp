#pragma once

#include <reactivedom/reactive/Cleanup.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RD {

using CellId = std::uint64_t;

class Scheduler;

/**
 * CellCore — type-erased part of a reactive cell
 *
 * Owns the ordered subscriber list and the pending-notify flag used by the
 * Scheduler to coalesce writes. Cell<T> layers the typed value on top.
 *
 * Notes
 * -----
 * - Subscribers are invoked in subscription order. Removing a subscriber while
 *   a notification pass is running prevents it from being called later in
 *   that pass; subscribers added during a pass are first called on the next.
 * - A subscriber that throws a std::exception is reported to the Scheduler as
 *   a subscriber fault and the pass continues.
 * - Disposers are cleanups for upstream bindings feeding this cell (a derived
 *   cell's subscriptions on its sources); dispose() runs them once.
 */
class CellCore : public std::enable_shared_from_this<CellCore> {
public:
    enum class Kind {
        Source,
        Derived,
        Tracked
    };

    explicit CellCore(Kind kind);
    virtual ~CellCore();

    CellCore(CellCore const&)            = delete;
    CellCore& operator=(CellCore const&) = delete;

    [[nodiscard]] auto id() const noexcept -> CellId { return id_; }
    [[nodiscard]] auto kind() const noexcept -> Kind { return kind_; }
    [[nodiscard]] auto subscriberCount() const noexcept -> std::size_t { return subscribers_.size(); }
    [[nodiscard]] auto isNotifyScheduled() const noexcept -> bool { return notifyScheduled_; }

    // Subscribe without receiving the value; used by the dependency tracker.
    [[nodiscard]] auto subscribeErased(std::function<void()> callback) -> Cleanup;

    auto addDisposer(Cleanup disposer) -> void;
    auto dispose() -> void;

    auto setLabel(std::string label) -> void;
    [[nodiscard]] auto label() const -> std::string const& { return label_; }

    // Short human readable rendering of the value, empty when the type has none.
    [[nodiscard]] virtual auto describeValue() const -> std::optional<std::string> = 0;

protected:
    // Record a tracked read with the active tracking frame and the registry.
    auto trackRead() -> void;
    // Record a write and schedule a notification pass.
    auto markChanged() -> void;

private:
    friend class Scheduler;

    struct Subscriber {
        std::function<void()> deliver;
        bool                  active = true;
    };

    // Invoke every active subscriber once; returns the number invoked.
    auto deliverNotifications() -> std::size_t;

    CellId                                    id_;
    Kind                                      kind_;
    std::string                               label_;
    std::vector<std::shared_ptr<Subscriber>> subscribers_;
    std::vector<Cleanup>                      disposers_;
    bool                                      notifyScheduled_ = false;
};

[[nodiscard]] auto cellKindToString(CellCore::Kind kind) -> char const*;

} // namespace RD
