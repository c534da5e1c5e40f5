#include <reactivedom/reactive/Scheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace RD {

auto Scheduler::current() -> Scheduler& {
    thread_local Scheduler scheduler;
    return scheduler;
}

auto Scheduler::schedule(std::shared_ptr<CellCore> cell) -> void {
    if (!cell || cell->notifyScheduled_)
        return;
    cell->notifyScheduled_ = true;
    bool const wasIdle     = queue_.empty();
    queue_.push_back(std::move(cell));
    rd_log("scheduled cell " + std::to_string(queue_.back()->id()) + " pending=" + std::to_string(queue_.size()), "Scheduler");

    if (wasIdle && !flushing_ && batchDepth_ == 0 && turnHook_)
        turnHook_();
}

auto Scheduler::flush() -> Expected<std::size_t> {
    if (flushing_)
        return 0;

    struct FlushingGuard {
        explicit FlushingGuard(bool& flag) : flag_(flag) { flag_ = true; }
        ~FlushingGuard() { flag_ = false; }
        bool& flag_;
    } guard(flushing_);

    ++stats_.flushes;
    std::size_t passes = 0;
    while (!queue_.empty()) {
        if (passes >= maxFlushIterations_) {
            auto const dropped = queue_.size();
            this->clear();
            stats_.droppedPasses += dropped;
            rd_log_fault("flush exceeded " + std::to_string(maxFlushIterations_) + " cell passes, dropped "
                             + std::to_string(dropped) + " pending notifications",
                         "NotificationLoop");
            return std::unexpected(Error{Error::Code::CapacityExceeded,
                                         "flush exceeded " + std::to_string(maxFlushIterations_) + " cell passes"});
        }
        auto cell = std::move(queue_.front());
        queue_.pop_front();
        // Cleared before delivery so that a write made by a subscriber schedules a fresh pass.
        cell->notifyScheduled_ = false;
        stats_.notificationsDelivered += cell->deliverNotifications();
        ++stats_.cellPasses;
        ++passes;
    }
    rd_log("flush delivered " + std::to_string(passes) + " cell passes", "Scheduler");
    return passes;
}

auto Scheduler::endBatch() -> void {
    if (batchDepth_ > 0)
        --batchDepth_;
    if (batchDepth_ != 0)
        return;
    auto result = this->flush();
    if (!result)
        rd_log_fault("batch flush failed: " + describeError(result.error()), "Batch");
}

auto Scheduler::reportFault(Fault fault) -> void {
    switch (fault.kind) {
    case Fault::Kind::Subscriber:
        ++stats_.subscriberFaults;
        break;
    case Fault::Kind::Evaluation:
        ++stats_.evaluationFaults;
        break;
    case Fault::Kind::Cleanup:
        ++stats_.cleanupFaults;
        break;
    case Fault::Kind::Mount:
        ++stats_.mountFaults;
        break;
    }
    if (faultHandler_)
        faultHandler_(fault);
}

auto Scheduler::clear() -> void {
    for (auto& cell : queue_)
        cell->notifyScheduled_ = false;
    queue_.clear();
}

} // namespace RD
