#include <reactivedom/reactive/CellCore.hpp>
#include <reactivedom/reactive/CellRegistry.hpp>
#include <reactivedom/reactive/Scheduler.hpp>
#include <reactivedom/reactive/TrackingContext.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <string>

namespace RD {
namespace {

std::atomic<CellId> g_nextCellId{1};

} // namespace

CellCore::CellCore(Kind kind)
    : id_(g_nextCellId.fetch_add(1, std::memory_order_relaxed))
    , kind_(kind) {}

CellCore::~CellCore() {
    if (CellRegistry::available()) {
        auto& registry = CellRegistry::current();
        if (registry.contains(id_))
            registry.forget(id_);
    }
}

auto CellCore::subscribeErased(std::function<void()> callback) -> Cleanup {
    auto subscriber = std::make_shared<Subscriber>(Subscriber{std::move(callback), true});
    subscribers_.push_back(subscriber);
    rd_log("subscribe cell " + std::to_string(id_) + " count=" + std::to_string(subscribers_.size()), "Cell");

    std::weak_ptr<CellCore>   weakCell = weak_from_this();
    std::weak_ptr<Subscriber> weakSub  = subscriber;
    return Cleanup([weakCell, weakSub]() {
        auto sub = weakSub.lock();
        if (!sub)
            return;
        sub->active = false;
        if (auto cell = weakCell.lock()) {
            auto& list = cell->subscribers_;
            list.erase(std::remove(list.begin(), list.end(), sub), list.end());
        }
    });
}

auto CellCore::addDisposer(Cleanup disposer) -> void {
    disposers_.push_back(std::move(disposer));
}

auto CellCore::dispose() -> void {
    auto disposers = std::move(disposers_);
    disposers_.clear();
    for (auto const& disposer : disposers)
        disposer();
}

auto CellCore::setLabel(std::string label) -> void {
    label_ = std::move(label);
    if (CellRegistry::available()) {
        auto& registry = CellRegistry::current();
        if (registry.contains(id_))
            registry.setLabel(id_, label_);
    }
}

auto CellCore::trackRead() -> void {
    auto& context = TrackingContext::current();
    if (context.isRecording())
        context.record(shared_from_this());
    auto& registry = CellRegistry::current();
    if (registry.enabled())
        registry.noteRead(id_);
}

auto CellCore::markChanged() -> void {
    auto& registry = CellRegistry::current();
    if (registry.enabled())
        registry.noteWrite(id_);
    Scheduler::current().schedule(shared_from_this());
}

auto CellCore::deliverNotifications() -> std::size_t {
    // Snapshot so that subscribe/unsubscribe from inside a callback cannot invalidate iteration.
    auto        snapshot  = subscribers_;
    std::size_t delivered = 0;
    for (auto const& subscriber : snapshot) {
        if (!subscriber->active || !subscriber->deliver)
            continue;
        try {
            subscriber->deliver();
        } catch (std::exception const& ex) {
            rd_log_fault("subscriber of cell " + std::to_string(id_) + " threw: " + ex.what(), "SubscriberFault");
            Scheduler::current().reportFault(Fault{Fault::Kind::Subscriber, id_, ex.what()});
        }
        ++delivered;
    }
    return delivered;
}

auto cellKindToString(CellCore::Kind kind) -> char const* {
    switch (kind) {
    case CellCore::Kind::Source:
        return "source";
    case CellCore::Kind::Derived:
        return "derived";
    case CellCore::Kind::Tracked:
        return "tracked";
    }
    return "source";
}

} // namespace RD
