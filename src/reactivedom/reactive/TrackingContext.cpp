#include <reactivedom/reactive/TrackingContext.hpp>

namespace RD {

auto TrackingContext::current() -> TrackingContext& {
    thread_local TrackingContext context;
    return context;
}

} // namespace RD
