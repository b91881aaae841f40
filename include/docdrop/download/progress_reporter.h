#pragma once

#include <docdrop/core/clock.h>
#include <docdrop/messenger/messenger.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace docdrop::download {

// Edits the status message in place. Failures are reported, never thrown.
using StatusEditor =
    std::function<Result<void>(const messenger::StatusTarget&, std::string_view text)>;

struct DownloadSession {
    std::string displayName;
    std::filesystem::path path;
    std::uint64_t expectedBytes{0}; // 0 = unknown, bytes-only reporting
    std::uint64_t receivedBytes{0};
    IClock::time_point startedAt{};
    IClock::time_point lastEmitAt{};
    messenger::StatusTarget target;
};

/**
 * Throttled translator from byte counts to status text for one download.
 *
 * Every chunk is forwarded downstream first; only bytes the downstream accepted are counted.
 * An edit goes out when strictly more than `interval` has passed since the previous one
 * (the announcement counts as the first). The reporter must outlive any sink returned by wrap().
 */
class ProgressReporter {
public:
    ProgressReporter(DownloadSession session, StatusEditor editor, std::shared_ptr<IClock> clock,
                     std::chrono::milliseconds interval = std::chrono::seconds(2));

    messenger::ByteSink wrap(messenger::ByteSink downstream);

    // Count n bytes and emit if the throttle allows.
    void record(std::uint64_t n);

    std::string renderProgress() const;
    std::string renderSummary() const;

    // Unconditional edit with text; failures are logged.
    void emit(std::string_view text);
    void emitSummary() { emit(renderSummary()); }

    double percentage() const;
    std::chrono::milliseconds elapsed() const;
    std::uint64_t averageBytesPerSecond() const;

    const DownloadSession& session() const noexcept { return session_; }
    std::size_t emissions() const noexcept { return emissions_; }

private:
    DownloadSession session_;
    StatusEditor editor_;
    std::shared_ptr<IClock> clock_;
    std::chrono::milliseconds interval_;
    std::size_t emissions_{0};
};

} // namespace docdrop::download
