#pragma once

#include <reactivedom/reactive/Cell.hpp>
#include <reactivedom/reactive/CellRegistry.hpp>
#include <reactivedom/reactive/Lifecycle.hpp>
#include <reactivedom/reactive/TrackingContext.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace RD {

// Heterogeneous source list for watch(); the callback receives a std::tuple.
template <typename... Ts>
struct SourceList {
    std::tuple<Cell<Ts>...> cells;
};

template <typename... Ts>
[[nodiscard]] auto sources(Cell<Ts> const&... cells) -> SourceList<Ts...> {
    return SourceList<Ts...>{std::tuple<Cell<Ts>...>{cells...}};
}

namespace detail {

template <typename Source>
struct SourceTraits;

template <typename T>
struct SourceTraits<Cell<T>> {
    using Values = T;

    static auto read(Cell<T> const& source) -> Values { return source.peek(); }
    static auto cores(Cell<T> const& source) -> std::vector<std::shared_ptr<CellCore>> { return {source.core()}; }

    using Weak = WeakCell<T>;
    static auto downgrade(Cell<T> const& source) -> Weak { return Weak(source); }
    static auto lock(Weak const& weak) -> std::optional<Cell<T>> {
        auto cell = weak.lock();
        if (!cell.valid())
            return std::nullopt;
        return cell;
    }
};

template <typename... Ts>
struct SourceTraits<SourceList<Ts...>> {
    using Values = std::tuple<Ts...>;

    static auto read(SourceList<Ts...> const& source) -> Values {
        return std::apply([](auto const&... cells) { return Values{cells.peek()...}; }, source.cells);
    }
    static auto cores(SourceList<Ts...> const& source) -> std::vector<std::shared_ptr<CellCore>> {
        return std::apply([](auto const&... cells) { return std::vector<std::shared_ptr<CellCore>>{cells.core()...}; },
                          source.cells);
    }

    using Weak = std::tuple<WeakCell<Ts>...>;
    static auto downgrade(SourceList<Ts...> const& source) -> Weak {
        return std::apply([](auto const&... cells) { return Weak{WeakCell<Ts>(cells)...}; }, source.cells);
    }
    static auto lock(Weak const& weak) -> std::optional<SourceList<Ts...>> {
        auto locked = std::apply([](auto const&... cells) { return std::tuple<Cell<Ts>...>{cells.lock()...}; }, weak);
        bool const alive = std::apply([](auto const&... cells) { return (cells.valid() && ...); }, locked);
        if (!alive)
            return std::nullopt;
        return SourceList<Ts...>{std::move(locked)};
    }
};

template <typename T>
struct SourceTraits<std::vector<Cell<T>>> {
    using Values = std::vector<T>;

    static auto read(std::vector<Cell<T>> const& source) -> Values {
        Values values;
        values.reserve(source.size());
        for (auto const& cell : source)
            values.push_back(cell.peek());
        return values;
    }
    static auto cores(std::vector<Cell<T>> const& source) -> std::vector<std::shared_ptr<CellCore>> {
        std::vector<std::shared_ptr<CellCore>> out;
        out.reserve(source.size());
        for (auto const& cell : source)
            out.push_back(cell.core());
        return out;
    }

    using Weak = std::vector<WeakCell<T>>;
    static auto downgrade(std::vector<Cell<T>> const& source) -> Weak {
        Weak weak;
        weak.reserve(source.size());
        for (auto const& cell : source)
            weak.emplace_back(cell);
        return weak;
    }
    static auto lock(Weak const& weak) -> std::optional<std::vector<Cell<T>>> {
        std::vector<Cell<T>> cells;
        cells.reserve(weak.size());
        for (auto const& handle : weak) {
            auto cell = handle.lock();
            if (!cell.valid())
                return std::nullopt;
            cells.push_back(std::move(cell));
        }
        return cells;
    }
};

template <typename Source>
concept WatchSource = requires { typename SourceTraits<std::remove_cvref_t<Source>>::Values; };

template <typename F, typename Values>
auto invokeWatch(F& fn, Values const& values, std::optional<Values> const& previous) -> decltype(auto) {
    if constexpr (std::is_invocable_v<F&, Values const&, std::optional<Values> const&>)
        return std::invoke(fn, values, previous);
    else
        return std::invoke(fn, values);
}

template <typename F, typename Values>
using WatchResult = std::remove_cvref_t<decltype(invokeWatch(std::declval<F&>(),
                                                             std::declval<Values const&>(),
                                                             std::declval<std::optional<Values> const&>()))>;

template <typename Source, typename F>
struct WatchBinding {
    using Traits = SourceTraits<Source>;
    using Values = typename Traits::Values;

    // Sources are held weakly: their subscriber lists own the binding.
    WatchBinding(Source const& src, F fn)
        : source(Traits::downgrade(src))
        , callback(std::move(fn))
        , last(Traits::read(src)) {
        for (auto const& core : Traits::cores(src))
            dependencies.push_back(core->id());
    }

    // Callback runs untracked so that reads inside it never become dependencies of an outer derive.
    auto call(Values const& values, std::optional<Values> const& previous) -> decltype(auto) {
        TrackingScope scope(nullptr);
        return invokeWatch(callback, values, previous);
    }

    // Current source values, or nothing once any source has been destroyed.
    auto readSources() const -> std::optional<Values> {
        auto strong = Traits::lock(source);
        if (!strong)
            return std::nullopt;
        return Traits::read(*strong);
    }

    auto release() -> void {
        auto subs = std::move(subscriptions);
        subscriptions.clear();
        for (auto const& sub : subs)
            sub();
        if (watcher != 0 && CellRegistry::available())
            CellRegistry::current().unregisterWatcher(watcher);
        watcher = 0;
    }

    typename Traits::Weak source;
    F                     callback;
    Values                last;
    std::vector<CellId>   dependencies;
    std::vector<Cleanup>  subscriptions;
    WatcherId             watcher = 0;
};

template <typename Binding, typename Source>
auto attachEffect(std::shared_ptr<Binding> binding, Source const& source) -> Cleanup {
    using Values = typename Binding::Values;
    for (auto const& core : Binding::Traits::cores(source)) {
        binding->subscriptions.push_back(core->subscribeErased([binding]() {
            auto next = binding->readSources();
            if (!next || shallowEqual(*next, binding->last))
                return;
            if (binding->watcher != 0)
                CellRegistry::current().noteWatcherTriggered(binding->watcher);
            auto previous = std::optional<Values>{std::move(binding->last)};
            binding->last = *next;
            binding->call(*next, previous);
        }));
    }
    auto& registry = CellRegistry::current();
    if (registry.enabled())
        binding->watcher = registry.registerWatcher("watch", binding->dependencies);

    Cleanup cleanup([binding]() { binding->release(); });
    registerWithCurrentScope(cleanup);
    return cleanup;
}

// With UnwrapOptional the callback returns std::optional<R> and an empty result leaves the cell untouched.
// The source subscriptions own the derived cell; the derived cell owns only the release of those subscriptions.
template <typename R, bool UnwrapOptional, typename Binding, typename Source>
auto attachComputed(std::shared_ptr<Binding> binding, Source const& source, R initial) -> Cell<R> {
    Cell<R> derived(std::move(initial), CellCore::Kind::Derived);
    for (auto const& core : Binding::Traits::cores(source)) {
        binding->subscriptions.push_back(core->subscribeErased([binding, derived]() {
            auto next = binding->readSources();
            if (!next || shallowEqual(*next, binding->last))
                return;
            auto previous = std::optional<typename Binding::Values>{std::move(binding->last)};
            binding->last = *next;
            auto result   = binding->call(*next, previous);
            if constexpr (UnwrapOptional) {
                if (!result)
                    return;
                if (!shallowEqual(*result, derived.peek()))
                    derived.set(std::move(*result));
            } else {
                if (!shallowEqual(result, derived.peek()))
                    derived.set(std::move(result));
            }
        }));
    }
    auto& registry = CellRegistry::current();
    if (registry.enabled())
        registry.setDependencies(derived.id(), binding->dependencies);

    std::weak_ptr<Binding> weakBinding = binding;
    Cleanup release([weakBinding]() {
        if (auto self = weakBinding.lock())
            self->release();
    });
    derived.core()->addDisposer(release);
    registerWithCurrentScope(release);
    return derived;
}

} // namespace detail

/**
 * Watched<R> — outcome of watch() with a callback returning std::optional<R>
 *
 * Computed when the first evaluation produced a value, effect otherwise.
 * Calling it tears the binding down in either mode.
 */
template <typename R>
class Watched {
public:
    explicit Watched(Cell<R> cell)
        : state_(std::move(cell)) {}
    explicit Watched(Cleanup cleanup)
        : state_(std::move(cleanup)) {}

    [[nodiscard]] auto isComputed() const noexcept -> bool { return std::holds_alternative<Cell<R>>(state_); }
    [[nodiscard]] auto isEffect() const noexcept -> bool { return !isComputed(); }

    // Only valid when isComputed().
    [[nodiscard]] auto cell() const -> Cell<R> const& { return std::get<Cell<R>>(state_); }

    auto operator()() const -> void {
        if (auto const* derived = std::get_if<Cell<R>>(&state_))
            derived->dispose();
        else
            std::get<Cleanup>(state_)();
    }

private:
    std::variant<Cell<R>, Cleanup> state_;
};

/**
 * watch — static binder over an explicit source set
 *
 * The callback is evaluated once immediately with (values) or
 * (values, previous) where previous is empty on that first call. Its
 * return type selects the mode:
 *   void              -> effect, returns Cleanup
 *   std::optional<R>  -> decided by the first result, returns Watched<R>
 *   R                 -> computed, returns Cell<R>
 * Later passes are skipped when the source values are shallowEqual to the
 * last observed ones; computed results shallowEqual to the cached value are
 * not written.
 */
template <detail::WatchSource Source, typename F>
[[nodiscard]] auto watch(Source const& source, F&& callback) {
    using Src     = std::remove_cvref_t<Source>;
    using Binding = detail::WatchBinding<Src, std::decay_t<F>>;
    using Values  = typename Binding::Values;
    using R       = detail::WatchResult<std::decay_t<F>, Values>;

    auto binding = std::make_shared<Binding>(source, std::forward<F>(callback));

    if constexpr (std::is_void_v<R>) {
        binding->call(binding->last, std::nullopt);
        return detail::attachEffect(std::move(binding), source);
    } else if constexpr (detail::IsOptional<R>::value) {
        using Inner = typename R::value_type;
        auto first  = binding->call(binding->last, std::nullopt);
        if (first)
            return Watched<Inner>(detail::attachComputed<Inner, true>(std::move(binding), source, std::move(*first)));
        return Watched<Inner>(detail::attachEffect(std::move(binding), source));
    } else {
        auto first = binding->call(binding->last, std::nullopt);
        return detail::attachComputed<R, false>(std::move(binding), source, std::move(first));
    }
}

// Effect mode regardless of the callback's return type.
template <detail::WatchSource Source, typename F>
auto watchEffect(Source const& source, F&& callback) -> Cleanup {
    auto effect = [fn = std::forward<F>(callback)](auto const& values, auto const& previous) mutable -> void {
        using V = std::remove_cvref_t<decltype(values)>;
        if constexpr (std::is_invocable_v<decltype(fn)&, V const&, std::optional<V> const&>)
            (void)std::invoke(fn, values, previous);
        else
            (void)std::invoke(fn, values);
    };
    return watch(source, std::move(effect));
}

// Computed mode over an explicit source set.
template <detail::WatchSource Source, typename F>
[[nodiscard]] auto derive(Source const& source, F&& compute) {
    using Src     = std::remove_cvref_t<Source>;
    using Binding = detail::WatchBinding<Src, std::decay_t<F>>;
    using R       = detail::WatchResult<std::decay_t<F>, typename Binding::Values>;
    static_assert(!std::is_void_v<R>, "derive requires a callback that returns a value");

    auto binding = std::make_shared<Binding>(source, std::forward<F>(compute));
    auto first   = binding->call(binding->last, std::nullopt);
    return detail::attachComputed<R, false>(std::move(binding), source, std::move(first));
}

} // namespace RD
