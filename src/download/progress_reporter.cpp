#include <docdrop/download/format.h>
#include <docdrop/download/progress_reporter.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace docdrop::download {

ProgressReporter::ProgressReporter(DownloadSession session, StatusEditor editor,
                                   std::shared_ptr<IClock> clock,
                                   std::chrono::milliseconds interval)
    : session_(std::move(session)), editor_(std::move(editor)),
      clock_(clock ? std::move(clock) : systemClock()), interval_(interval) {
    if (session_.startedAt == IClock::time_point{}) {
        session_.startedAt = clock_->now();
    }
    if (session_.lastEmitAt == IClock::time_point{}) {
        session_.lastEmitAt = session_.startedAt;
    }
}

messenger::ByteSink ProgressReporter::wrap(messenger::ByteSink downstream) {
    return [this, downstream = std::move(downstream)](ByteSpan chunk) -> Result<void> {
        if (downstream) {
            if (auto r = downstream(chunk); !r) {
                return r;
            }
        }
        record(chunk.size());
        return {};
    };
}

void ProgressReporter::record(std::uint64_t n) {
    session_.receivedBytes += n;
    const auto now = clock_->now();
    if (now - session_.lastEmitAt > interval_) {
        emit(renderProgress());
        session_.lastEmitAt = now;
    }
}

double ProgressReporter::percentage() const {
    if (session_.expectedBytes == 0) {
        return 0.0;
    }
    const double pct = static_cast<double>(session_.receivedBytes) /
                       static_cast<double>(session_.expectedBytes) * 100.0;
    return std::min(pct, 100.0);
}

std::chrono::milliseconds ProgressReporter::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() -
                                                                 session_.startedAt);
}

std::uint64_t ProgressReporter::averageBytesPerSecond() const {
    const auto ms = elapsed().count();
    if (ms <= 0) {
        return session_.receivedBytes;
    }
    return static_cast<std::uint64_t>(static_cast<double>(session_.receivedBytes) * 1000.0 /
                                      static_cast<double>(ms));
}

std::string ProgressReporter::renderProgress() const {
    const auto current = session_.receivedBytes;
    if (session_.expectedBytes == 0) {
        return fmt::format("📥 Downloading: {}\n🔄 Progress: {} downloaded\n⏱️ In progress...",
                           session_.displayName, formatBytes(current));
    }

    const auto total = session_.expectedBytes;
    const double pct = percentage();

    std::string eta;
    const auto elapsedMs = elapsed().count();
    if (current > 0 && elapsedMs > 0) {
        const double bytesPerMs = static_cast<double>(current) / static_cast<double>(elapsedMs);
        const auto remaining = total > current ? total - current : 0;
        const auto etaMs = static_cast<std::int64_t>(static_cast<double>(remaining) / bytesPerMs);
        eta = fmt::format(" • ETA: {}", formatDuration(std::chrono::milliseconds(etaMs)));
    }

    return fmt::format("📥 Downloading: {}\n{} {:.1f}%\n📊 {} / {}{}", session_.displayName,
                       renderProgressBar(pct), pct, formatBytes(current), formatBytes(total), eta);
}

std::string ProgressReporter::renderSummary() const {
    return fmt::format("✅ Downloaded: {}\n📊 Size: {}\n⚡ Avg Speed: {}/s\n📁 Saved to: {}",
                       session_.path.filename().string(), formatBytes(session_.receivedBytes),
                       formatBytes(averageBytesPerSecond()), session_.path.string());
}

void ProgressReporter::emit(std::string_view text) {
    if (session_.target.isNull() || !editor_) {
        return;
    }
    ++emissions_;
    if (auto r = editor_(session_.target, text); !r) {
        spdlog::warn("Status update for {} failed: {}", session_.displayName, r.error().message);
    }
}

} // namespace docdrop::download
