#include <reactivedom/dom/KeyedList.hpp>

#include "log/TaggedLogger.hpp"

namespace RD::Dom::detail {

auto reportListFailure(Error const& error) -> void {
    rd_log_fault("list update rejected, region left unchanged: " + describeError(error), "ListFault");
}

} // namespace RD::Dom::detail
