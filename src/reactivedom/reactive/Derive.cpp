#include <reactivedom/reactive/Derive.hpp>
#include <reactivedom/reactive/Scheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace RD::detail {

auto reportEvaluationFault(CellId cell, char const* what) -> void {
    rd_log_fault("derive of cell " + std::to_string(cell) + " threw: " + what + ", keeping last value", "EvaluationFault");
    Scheduler::current().reportFault(Fault{Fault::Kind::Evaluation, cell, what});
}

auto reportReentrantRecompute(CellId cell) -> void {
    rd_log_fault("re-entrant recompute of cell " + std::to_string(cell) + " skipped", "DeriveReentry");
}

} // namespace RD::detail
