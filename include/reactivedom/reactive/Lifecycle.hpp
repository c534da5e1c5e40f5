#pragma once

#include <reactivedom/core/Error.hpp>
#include <reactivedom/reactive/Cleanup.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace RD {

/**
 * LifecycleScope — ownership bucket for the bindings of one component
 *
 * Purpose
 * -------
 * Collects the Cleanup of every watch, derive and DOM binding created while
 * the scope is active, plus mount callbacks queued with onMount.
 *
 * Notes
 * -----
 * - mount() runs the queued callbacks once; a callback may return a Cleanup
 *   which joins the scope. Callbacks queued after mount run immediately.
 * - dispose() runs every cleanup once in registration order. A std::exception
 *   thrown by one is reported as a cleanup fault and the rest still run.
 *   Cleanups added after dispose run immediately.
 * - The destructor disposes and is noexcept. Only std::exception is
 *   contained, so a cleanup throwing any other type terminates the program
 *   when the scope is destroyed; call dispose() first to let it propagate.
 */
class LifecycleScope {
public:
    using MountCallback = std::function<Cleanup()>;

    LifecycleScope() = default;
    ~LifecycleScope() noexcept;

    LifecycleScope(LifecycleScope const&)            = delete;
    LifecycleScope& operator=(LifecycleScope const&) = delete;

    // Innermost active scope on this thread, nullptr when none.
    static auto current() noexcept -> LifecycleScope*;

    auto addCleanup(Cleanup cleanup) -> void;

    template <typename F>
    auto onMount(F&& callback) -> void {
        using R = std::invoke_result_t<F&>;
        if constexpr (std::is_same_v<R, Cleanup>) {
            this->queueMount(MountCallback(std::forward<F>(callback)));
        } else {
            static_assert(std::is_void_v<R>, "onMount callback must return void or Cleanup");
            this->queueMount(MountCallback([fn = std::forward<F>(callback)]() mutable -> Cleanup {
                fn();
                return {};
            }));
        }
    }

    auto mount() -> void;
    auto dispose() -> void;

    [[nodiscard]] auto isMounted() const noexcept -> bool { return mounted_; }
    [[nodiscard]] auto isDisposed() const noexcept -> bool { return disposed_; }
    [[nodiscard]] auto cleanupCount() const noexcept -> std::size_t { return cleanups_.size(); }
    [[nodiscard]] auto pendingMountCount() const noexcept -> std::size_t { return mountCallbacks_.size(); }

private:
    auto queueMount(MountCallback callback) -> void;
    auto runMount(MountCallback& callback) -> void;

    std::vector<Cleanup>       cleanups_;
    std::vector<MountCallback> mountCallbacks_;
    bool                       mounted_  = false;
    bool                       disposed_ = false;
};

// Makes a scope current for its lifetime; nests.
class ScopeActivation {
public:
    explicit ScopeActivation(LifecycleScope& scope);
    ~ScopeActivation();

    ScopeActivation(ScopeActivation const&)            = delete;
    ScopeActivation& operator=(ScopeActivation const&) = delete;

private:
    std::size_t restoreDepth_;
};

// Hand a binding's cleanup to the active scope, if any.
auto registerWithCurrentScope(Cleanup const& cleanup) -> void;

namespace detail {
// Logs the misuse and returns the NoActiveScope error for hook.
auto missingScope(char const* hook) -> Error;
} // namespace detail

auto onUnmount(std::function<void()> callback) -> Expected<void>;

template <typename F>
auto onMount(F&& callback) -> Expected<void> {
    auto* scope = LifecycleScope::current();
    if (!scope)
        return std::unexpected(detail::missingScope("onMount"));
    scope->onMount(std::forward<F>(callback));
    return {};
}

} // namespace RD
