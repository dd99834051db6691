#include "PermitPools.hpp"
#include "../common/Logger.hpp"

#include <algorithm>

namespace Parfetch {

ConcurrencyGate::ConcurrencyGate(int permits, QObject* parent)
    : QObject(parent)
    , capacity_(std::max(permits, 0)) {
}

void ConcurrencyGate::acquire(std::function<void()> onGranted) {
    if (inUse_ < capacity_ && waiters_.empty()) {
        grant(std::move(onGranted));
        return;
    }
    waiters_.push_back(std::move(onGranted));
    PARFETCH_TRACE("ConcurrencyGate: {} waiter(s) queued, {}/{} permits in use",
                   waiters_.size(), inUse_, capacity_);
}

void ConcurrencyGate::release() {
    if (inUse_ <= 0) {
        PARFETCH_WARN("ConcurrencyGate: release without a matching acquire");
        return;
    }
    --inUse_;

    if (waiters_.empty()) {
        return;
    }

    // Hand the freed permit to the oldest waiter. The continuation runs from
    // the event loop, never from inside the releasing worker.
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    ++inUse_;
    QMetaObject::invokeMethod(this, [next = std::move(next)]() { next(); }, Qt::QueuedConnection);
}

void ConcurrencyGate::grant(std::function<void()> onGranted) {
    ++inUse_;
    peakInUse_ = std::max(peakInUse_, inUse_);
    onGranted();
}

FailureGate::FailureGate(int permits)
    : capacity_(std::max(permits, 0)) {
}

std::optional<FailureGate::Permit> FailureGate::tryAcquire() {
    if (inUse_ >= capacity_) {
        return std::nullopt;
    }
    ++inUse_;
    peakInUse_ = std::max(peakInUse_, inUse_);
    return Permit(this);
}

void FailureGate::giveBack() {
    if (inUse_ > 0) {
        --inUse_;
    }
}

FailureGate::Permit::~Permit() {
    release();
}

FailureGate::Permit::Permit(Permit&& other) noexcept
    : gate_(other.gate_) {
    other.gate_ = nullptr;
}

FailureGate::Permit& FailureGate::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void FailureGate::Permit::release() {
    if (gate_) {
        gate_->giveBack();
        gate_ = nullptr;
    }
}

} // namespace Parfetch
