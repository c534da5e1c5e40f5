#pragma once

#include <reactivedom/reactive/CellCore.hpp>
#include <reactivedom/reactive/CellRegistry.hpp>
#include <reactivedom/reactive/Cleanup.hpp>
#include <reactivedom/reactive/Equality.hpp>
#include <reactivedom/reactive/ValueText.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace RD {

namespace detail {

template <typename T>
class CellState final : public CellCore {
public:
    CellState(Kind kind, T initial)
        : CellCore(kind)
        , value_(std::move(initial)) {}

    auto read() -> T const& {
        this->trackRead();
        return value_;
    }

    [[nodiscard]] auto peek() const noexcept -> T const& { return value_; }

    auto write(T next) -> bool {
        if (sameValue(value_, next))
            return false;
        value_ = std::move(next);
        this->markChanged();
        return true;
    }

    [[nodiscard]] auto describeValue() const -> std::optional<std::string> override {
        return toDisplayString(value_);
    }

private:
    T value_;
};

} // namespace detail

template <typename T>
class WeakCell;

/**
 * Cell<T> — handle to a reactive memory location
 *
 * Copies alias the same cell; equality is identity. get() participates in
 * dependency tracking when a recording frame is active, peek() never does.
 * set() is skipped when the new value is sameValue() to the current one;
 * that check is shallow, so mutating an object reached through a held
 * pointer does not notify. Subscribers run on the next scheduler turn with
 * the value current at that time.
 *
 * Using a default constructed (empty) handle other than valid() or
 * assignment is undefined behavior.
 */
template <typename T>
class Cell {
public:
    using value_type = T;

    Cell() = default;

    explicit Cell(T initial, CellCore::Kind kind = CellCore::Kind::Source)
        : state_(std::make_shared<detail::CellState<T>>(kind, std::move(initial))) {
        auto& registry = CellRegistry::current();
        if (registry.enabled())
            registry.track(state_);
    }

    [[nodiscard]] auto valid() const noexcept -> bool { return static_cast<bool>(state_); }
    [[nodiscard]] auto id() const noexcept -> CellId { return state_->id(); }

    [[nodiscard]] auto get() const -> T const& { return state_->read(); }
    [[nodiscard]] auto peek() const noexcept -> T const& { return state_->peek(); }

    // Returns true when the value changed and a notification was scheduled.
    auto set(T next) const -> bool { return state_->write(std::move(next)); }

    template <typename F>
    auto update(F&& mutator) const -> bool {
        return state_->write(std::invoke(std::forward<F>(mutator), state_->peek()));
    }

    template <typename F>
    [[nodiscard]] auto subscribe(F&& callback) const -> Cleanup {
        auto* state = state_.get();
        return state_->subscribeErased(
            [state, cb = std::forward<F>(callback)]() mutable { std::invoke(cb, state->peek()); });
    }

    [[nodiscard]] auto subscriberCount() const noexcept -> std::size_t { return state_->subscriberCount(); }

    // Release the upstream bindings that feed a derived cell.
    auto dispose() const -> void { state_->dispose(); }

    auto setLabel(std::string label) const -> Cell const& {
        state_->setLabel(std::move(label));
        return *this;
    }

    [[nodiscard]] auto core() const noexcept -> std::shared_ptr<CellCore> { return state_; }

    friend auto operator==(Cell const& lhs, Cell const& rhs) noexcept -> bool {
        return lhs.state_ == rhs.state_;
    }

private:
    friend class WeakCell<T>;

    explicit Cell(std::shared_ptr<detail::CellState<T>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CellState<T>> state_;
};

// Non-owning Cell handle; lock() yields an empty Cell once the cell is gone.
template <typename T>
class WeakCell {
public:
    WeakCell() = default;
    explicit WeakCell(Cell<T> const& cell)
        : state_(cell.state_) {}

    [[nodiscard]] auto lock() const -> Cell<T> { return Cell<T>(state_.lock()); }
    [[nodiscard]] auto expired() const noexcept -> bool { return state_.expired(); }

private:
    std::weak_ptr<detail::CellState<T>> state_;
};

template <typename T>
[[nodiscard]] auto makeCell(T initial) -> Cell<std::decay_t<T>> {
    return Cell<std::decay_t<T>>(std::move(initial));
}

[[nodiscard]] inline auto makeCell(char const* initial) -> Cell<std::string> {
    return Cell<std::string>(std::string{initial});
}

namespace detail {

template <typename T>
struct IsCell : std::false_type {};
template <typename T>
struct IsCell<Cell<T>> : std::true_type {};

} // namespace detail

template <typename T>
concept CellHandle = detail::IsCell<std::remove_cvref_t<T>>::value;

} // namespace RD
