#include <reactivedom/reactive/Lifecycle.hpp>
#include <reactivedom/reactive/Scheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>

namespace RD {
namespace {

auto scopeStack() -> std::vector<LifecycleScope*>& {
    thread_local std::vector<LifecycleScope*> stack;
    return stack;
}

} // namespace

LifecycleScope::~LifecycleScope() noexcept {
    this->dispose();
}

auto LifecycleScope::current() noexcept -> LifecycleScope* {
    auto& stack = scopeStack();
    return stack.empty() ? nullptr : stack.back();
}

auto LifecycleScope::addCleanup(Cleanup cleanup) -> void {
    if (disposed_) {
        cleanup();
        return;
    }
    cleanups_.push_back(std::move(cleanup));
}

auto LifecycleScope::queueMount(MountCallback callback) -> void {
    if (disposed_)
        return;
    if (mounted_) {
        this->runMount(callback);
        return;
    }
    mountCallbacks_.push_back(std::move(callback));
}

auto LifecycleScope::runMount(MountCallback& callback) -> void {
    try {
        auto cleanup = callback();
        if (cleanup)
            this->addCleanup(std::move(cleanup));
    } catch (std::exception const& ex) {
        rd_log_fault(std::string{"mount callback threw: "} + ex.what(), "MountFault");
        Scheduler::current().reportFault(Fault{Fault::Kind::Mount, 0, ex.what()});
    }
}

auto LifecycleScope::mount() -> void {
    if (mounted_ || disposed_)
        return;
    mounted_       = true;
    auto callbacks = std::move(mountCallbacks_);
    mountCallbacks_.clear();
    for (auto& callback : callbacks)
        this->runMount(callback);
}

auto LifecycleScope::dispose() -> void {
    if (disposed_)
        return;
    disposed_ = true;
    mountCallbacks_.clear();
    auto cleanups = std::move(cleanups_);
    cleanups_.clear();
    for (auto const& cleanup : cleanups) {
        try {
            cleanup();
        } catch (std::exception const& ex) {
            rd_log_fault(std::string{"cleanup threw: "} + ex.what(), "CleanupFault");
            Scheduler::current().reportFault(Fault{Fault::Kind::Cleanup, 0, ex.what()});
        }
    }
}

ScopeActivation::ScopeActivation(LifecycleScope& scope)
    : restoreDepth_(scopeStack().size()) {
    scopeStack().push_back(&scope);
}

ScopeActivation::~ScopeActivation() {
    scopeStack().resize(restoreDepth_);
}

auto registerWithCurrentScope(Cleanup const& cleanup) -> void {
    if (auto* scope = LifecycleScope::current())
        scope->addCleanup(cleanup);
}

auto detail::missingScope(char const* hook) -> Error {
    std::string message = std::string{hook} + " called outside a lifecycle scope";
    rd_log_fault(message, "LifecycleWarning");
    return Error{Error::Code::NoActiveScope, std::move(message)};
}

auto onUnmount(std::function<void()> callback) -> Expected<void> {
    auto* scope = LifecycleScope::current();
    if (!scope)
        return std::unexpected(detail::missingScope("onUnmount"));
    scope->addCleanup(Cleanup(std::move(callback)));
    return {};
}

} // namespace RD
