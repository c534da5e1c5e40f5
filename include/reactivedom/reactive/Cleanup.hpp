#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace RD {

/**
 * Cleanup — idempotent teardown handle
 *
 * Copies share one once-flag: whichever copy runs first executes the wrapped
 * function and releases its captures, every later call is a no-op. A default
 * constructed Cleanup is an inert handle.
 */
class Cleanup {
public:
    Cleanup() = default;

    explicit Cleanup(std::function<void()> fn)
        : state_(std::make_shared<State>(State{std::move(fn), false})) {}

    auto operator()() const -> void {
        if (!state_ || state_->done)
            return;
        state_->done = true;
        auto fn      = std::move(state_->fn);
        state_->fn   = nullptr;
        if (fn)
            fn();
    }

    [[nodiscard]] auto active() const noexcept -> bool {
        return state_ && !state_->done;
    }

    explicit operator bool() const noexcept {
        return active();
    }

    [[nodiscard]] static auto combine(std::vector<Cleanup> parts) -> Cleanup {
        return Cleanup([parts = std::move(parts)]() {
            for (auto const& part : parts)
                part();
        });
    }

private:
    struct State {
        std::function<void()> fn;
        bool                  done = false;
    };

    std::shared_ptr<State> state_;
};

} // namespace RD
