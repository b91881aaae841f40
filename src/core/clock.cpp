#include <docdrop/core/clock.h>

#include <thread>

namespace docdrop {

namespace {

class SteadyClock final : public IClock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }

    void sleepFor(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};

} // namespace

std::shared_ptr<IClock> systemClock() {
    static auto clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace docdrop
