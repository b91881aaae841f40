#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace docdrop {

// Cooperative cancellation predicate; return true to abandon the operation ASAP.
using ShouldCancel = std::function<bool()>;

/**
 * Monotonic time source used by every component that waits or throttles.
 * Tests substitute a manual clock so polling loops and throttles run without real sleeps.
 */
class IClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    virtual time_point now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/**
 * Process-wide steady clock backed by std::this_thread::sleep_for.
 */
std::shared_ptr<IClock> systemClock();

inline bool cancelled(const ShouldCancel& shouldCancel) {
    return shouldCancel && shouldCancel();
}

} // namespace docdrop
