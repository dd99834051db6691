#pragma once

#include <QtCore/QObject>
#include <deque>
#include <functional>
#include <optional>

namespace Parfetch {

/**
 * @brief Waiting permit pool bounding the number of chunks in flight
 *
 * acquire() never blocks the event loop: the continuation runs immediately
 * when a permit is free, otherwise it is queued and dispatched (first in,
 * first out) from the event loop once a holder calls release().
 */
class ConcurrencyGate : public QObject {
    Q_OBJECT

public:
    explicit ConcurrencyGate(int permits, QObject* parent = nullptr);

    void acquire(std::function<void()> onGranted);
    void release();

    int capacity() const { return capacity_; }
    int inUse() const { return inUse_; }
    int available() const { return capacity_ - inUse_; }
    int waiting() const { return static_cast<int>(waiters_.size()); }
    int peakInUse() const { return peakInUse_; }

private:
    void grant(std::function<void()> onGranted);

    int capacity_;
    int inUse_ = 0;
    int peakInUse_ = 0;
    std::deque<std::function<void()>> waiters_;
};

/**
 * @brief Fail-fast permit pool bounding the number of chunks retrying at once
 *
 * tryAcquire() never waits. The returned permit gives its slot back when it
 * is released or destroyed. The gate must outlive every permit it hands out.
 */
class FailureGate {
public:
    class Permit {
    public:
        Permit() = default;
        ~Permit();

        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        bool isValid() const { return gate_ != nullptr; }
        void release();

    private:
        friend class FailureGate;
        explicit Permit(FailureGate* gate) : gate_(gate) {}

        FailureGate* gate_ = nullptr;
    };

    explicit FailureGate(int permits);

    std::optional<Permit> tryAcquire();

    int capacity() const { return capacity_; }
    int inUse() const { return inUse_; }
    int available() const { return capacity_ - inUse_; }
    int peakInUse() const { return peakInUse_; }

private:
    void giveBack();

    int capacity_;
    int inUse_ = 0;
    int peakInUse_ = 0;
};

} // namespace Parfetch
