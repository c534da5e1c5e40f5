#pragma once

#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/Watch.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace RD {

/**
 * SubStore<U> — focused view over a slice of a Store
 *
 * value() is a derived cell that follows the slice; every write rebuilds
 * the root through the put function given to Store::branch and writes it
 * back to the root cell.
 */
template <typename U>
class SubStore {
public:
    SubStore(Cell<U> value, std::function<U()> current, std::function<bool(U)> write)
        : value_(std::move(value))
        , current_(std::move(current))
        , write_(std::move(write)) {}

    [[nodiscard]] auto value() const noexcept -> Cell<U> const& { return value_; }

    auto set(U next) const -> bool { return write_(std::move(next)); }

    template <typename F>
    auto update(F&& mutator) const -> bool {
        auto prev = current_();
        auto next = std::invoke(std::forward<F>(mutator), std::as_const(prev));
        if (sameValue(prev, next))
            return false;
        return write_(std::move(next));
    }

    template <typename M>
    auto updateAt(M U::*member, M next) const -> bool {
        auto copy = current_();
        if (sameValue(copy.*member, next))
            return false;
        copy.*member = std::move(next);
        return write_(std::move(copy));
    }

private:
    Cell<U>                value_;
    std::function<U()>     current_;
    std::function<bool(U)> write_;
};

/**
 * Store<T> — structured immutable state over a root cell
 *
 * Writes build a new root value and assign it; a write whose result is
 * identical to the current root (sameValue) schedules nothing. All write
 * helpers return true when the root changed.
 */
template <typename T>
class Store {
public:
    explicit Store(T initial)
        : root_(std::move(initial)) {}

    [[nodiscard]] auto value() const noexcept -> Cell<T> const& { return root_; }

    auto set(T next) const -> bool { return root_.set(std::move(next)); }

    template <typename F>
    auto update(F&& mutator) const -> bool {
        return root_.set(std::invoke(std::forward<F>(mutator), root_.peek()));
    }

    // Edit a copy of the root in place.
    template <typename F>
    auto patch(F&& edit) const -> bool {
        T draft = root_.peek();
        std::invoke(std::forward<F>(edit), draft);
        return root_.set(std::move(draft));
    }

    template <typename M, typename F>
    auto updateAt(M T::*member, F&& mutator) const -> bool {
        auto const& prev = root_.peek().*member;
        M           next = std::invoke(std::forward<F>(mutator), prev);
        if (sameValue(prev, next))
            return false;
        T copy       = root_.peek();
        copy.*member = std::move(next);
        return root_.set(std::move(copy));
    }

    // Lens style update without keeping a branch around.
    template <typename Get, typename F, typename Put>
    auto updateAt(Get&& get, F&& mutator, Put&& put) const -> bool {
        auto prev = std::invoke(get, root_.peek());
        auto next = std::invoke(std::forward<F>(mutator), std::as_const(prev));
        if (sameValue(prev, next))
            return false;
        return root_.set(std::invoke(std::forward<Put>(put), root_.peek(), std::move(next)));
    }

    template <typename Get, typename Put>
    [[nodiscard]] auto branch(Get get, Put put) const -> SubStore<std::decay_t<std::invoke_result_t<Get&, T const&>>> {
        using U    = std::decay_t<std::invoke_result_t<Get&, T const&>>;
        auto root  = root_;
        auto slice = derive(root, [get](T const& value) -> U { return std::invoke(get, value); });
        return SubStore<U>(
            std::move(slice),
            [root, get]() -> U { return std::invoke(get, root.peek()); },
            [root, put](U next) -> bool { return root.set(std::invoke(put, root.peek(), std::move(next))); });
    }

private:
    Cell<T> root_;
};

} // namespace RD
