#include <docdrop/config/agent_config.h>
#include <docdrop/config/config_helpers.h>
#include <docdrop/download/download_orchestrator.h>
#include <docdrop/download/filename_resolver.h>
#include <docdrop/download/format.h>
#include <docdrop/download/progress_reporter.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace docdrop::download {

using messenger::StatusTarget;

DownloadPolicy DownloadPolicy::fromConfig(const config::AgentConfig& config) {
    DownloadPolicy policy;
    policy.downloadRoot = config.downloadRoot;
    policy.allowedExtensions = config.allowedExtensions;
    policy.maxFileBytes = config.maxFileBytes;
    policy.progressInterval = config.progressInterval;
    return policy;
}

bool DownloadPolicy::extensionAllowed(const std::string& extension) const {
    if (allowedExtensions.empty()) {
        return true;
    }
    return std::find(allowedExtensions.begin(), allowedExtensions.end(), extension) !=
           allowedExtensions.end();
}

const char* toString(DownloadStage stage) {
    switch (stage) {
        case DownloadStage::Validating: return "validating";
        case DownloadStage::Naming: return "naming";
        case DownloadStage::Announcing: return "announcing";
        case DownloadStage::Streaming: return "streaming";
        case DownloadStage::Finalizing: return "finalizing";
        case DownloadStage::Done: return "done";
        case DownloadStage::Rejected: return "rejected";
        case DownloadStage::Failed: return "failed";
    }
    return "unknown";
}

DownloadOrchestrator::DownloadOrchestrator(messenger::IMessengerClient& client,
                                           DownloadPolicy policy, std::shared_ptr<IClock> clock)
    : client_(client), policy_(std::move(policy)),
      clock_(clock ? std::move(clock) : systemClock()) {}

void DownloadOrchestrator::enter(DownloadStage stage, const std::string& name) {
    stage_ = stage;
    spdlog::debug("[{}] {}", toString(stage), name);
}

void DownloadOrchestrator::reply(const messenger::PeerRef& peer, const std::string& text) {
    if (auto r = client_.sendText(peer, text); !r) {
        spdlog::warn("Failed to send message to {}: {}", peer.id, r.error().message);
    }
}

void DownloadOrchestrator::edit(const StatusTarget& target, const std::string& text) {
    if (target.isNull()) {
        return;
    }
    if (auto r = client_.editText(target.peer, *target.messageId, text); !r) {
        spdlog::warn("Failed to update status message {}: {}", *target.messageId,
                     r.error().message);
    }
}

Result<DownloadOutcome> DownloadOrchestrator::handle(const routing::Accepted& accepted,
                                                     const ShouldCancel& shouldCancel) {
    const auto& doc = accepted.document;
    const std::string declaredName = doc.displayName();

    // ---------- Validating ----------
    enter(DownloadStage::Validating, declaredName);
    spdlog::info("Found document in message {} from user {}: {} (size: {} bytes{}{})",
                 accepted.messageId, accepted.senderId, declaredName, doc.size,
                 doc.mimeType.empty() ? "" : ", type: ", doc.mimeType);

    if (!policy_.allowedExtensions.empty()) {
        const auto ext = extensionOf(declaredName);
        if (!policy_.extensionAllowed(ext)) {
            const auto allowed = config::join(policy_.allowedExtensions);
            reply(accepted.replyTo,
                  fmt::format("❌ File type not allowed: {}\n📎 Extension: {}\n✅ Allowed types: "
                              "{}\n\n💡 Please convert your file to an allowed format or contact "
                              "the administrator to add this file type.",
                              declaredName, ext, allowed));
            spdlog::info("File {} rejected: extension '{}' not in allowed list [{}]",
                         declaredName, ext, allowed);
            stage_ = DownloadStage::Rejected;
            return Error{ErrorCode::ValidationError,
                         fmt::format("file extension '{}' not allowed", ext)};
        }
    }

    if (policy_.maxFileBytes > 0 && doc.size > policy_.maxFileBytes) {
        reply(accepted.replyTo,
              fmt::format("❌ File too large: {}\n📊 Size: {}\n🚫 Maximum limit: {}\n\n💡 Files "
                          "above this limit cannot be downloaded through the client API.",
                          declaredName, formatBytes(doc.size),
                          formatBytes(policy_.maxFileBytes)));
        spdlog::info("File {} rejected: size {} bytes exceeds {} bytes limit", declaredName,
                     doc.size, policy_.maxFileBytes);
        stage_ = DownloadStage::Rejected;
        return Error{ErrorCode::ValidationError,
                     fmt::format("file size {} bytes exceeds maximum limit of {} bytes", doc.size,
                                 policy_.maxFileBytes)};
    }

    // ---------- Naming ----------
    enter(DownloadStage::Naming, declaredName);
    const auto requested = policy_.downloadRoot / sanitizeFilename(declaredName);

    // ---------- Announcing ----------
    enter(DownloadStage::Announcing, declaredName);
    StatusTarget target{accepted.replyTo, std::nullopt};
    if (auto sent = client_.sendText(
            accepted.replyTo, fmt::format("📥 Downloading: {}\n📊 Size: {}\n⏳ Starting download...",
                                          declaredName, formatBytes(doc.size)));
        sent) {
        target.messageId = sent.value();
    } else {
        spdlog::warn("Error sending status message: {}", sent.error().message);
    }

    // ---------- Streaming ----------
    enter(DownloadStage::Streaming, declaredName);
    auto created = createExclusive(requested);
    if (!created) {
        spdlog::error("Error creating file {}: {}", requested.string(), created.error().message);
        edit(target, fmt::format("❌ Error creating file: {}\n💾 Check disk space and permissions",
                                 requested.filename().string()));
        stage_ = DownloadStage::Failed;
        return created.error();
    }
    ExclusiveFile file = std::move(created).value();
    const auto finalName = file.path().filename().string();
    if (file.path() != requested) {
        spdlog::info("File already exists, using unique name: {}", finalName);
    }

    edit(target, fmt::format("📥 Downloading: {}\n📊 Size: {}\n🔄 Connecting...", finalName,
                             formatBytes(doc.size)));
    spdlog::info("Downloading file: {}", finalName);

    DownloadSession session;
    session.displayName = finalName;
    session.path = file.path();
    session.expectedBytes = doc.size;
    session.target = target;
    ProgressReporter reporter(std::move(session),
                              [this](const StatusTarget& t, std::string_view text) -> Result<void> {
                                  return client_.editText(t.peer, *t.messageId, text);
                              },
                              clock_, policy_.progressInterval);

    bool diskFailed = false;
    auto fileSink = [&](ByteSpan chunk) -> Result<void> {
        if (policy_.maxFileBytes > 0 &&
            file.bytesWritten() + chunk.size() > policy_.maxFileBytes) {
            return Error{ErrorCode::PolicyViolation,
                         "exceeded maximum file size during download"};
        }
        auto wr = file.write(chunk);
        if (!wr) {
            diskFailed = true;
        }
        return wr;
    };

    auto streamed = client_.streamDocument(doc.locator, reporter.wrap(fileSink), shouldCancel);
    if (!streamed) {
        const auto& err = streamed.error();
        stage_ = DownloadStage::Failed;
        if (err.code == ErrorCode::OperationCancelled || cancelled(shouldCancel)) {
            spdlog::warn("Download of {} interrupted after {} bytes", finalName,
                         reporter.session().receivedBytes);
            edit(target, fmt::format("⚠️ Download interrupted: {}\n🔌 Agent is shutting down",
                                     finalName));
            return Error{ErrorCode::OperationCancelled, "download interrupted: " + finalName};
        }
        if (err.code == ErrorCode::PolicyViolation) {
            spdlog::error("Download of {} aborted: {}", finalName, err.message);
            edit(target, fmt::format("❌ Download aborted: {}\n🚫 Maximum limit: {} exceeded",
                                     finalName, formatBytes(policy_.maxFileBytes)));
            return err;
        }
        if (diskFailed) {
            spdlog::error("Disk error while downloading {}: {}", finalName, err.message);
            edit(target, fmt::format("❌ Download failed: {}\n💾 Disk error occurred", finalName));
            return err;
        }
        spdlog::error("Error downloading file {}: {}", finalName, err.message);
        edit(target, fmt::format("❌ Download failed: {}\n🌐 Network error occurred", finalName));
        return Error{ErrorCode::NetworkError, err.message};
    }

    // ---------- Finalizing ----------
    enter(DownloadStage::Finalizing, finalName);
    if (auto closed = file.close(); !closed) {
        spdlog::error("Error closing {}: {}", finalName, closed.error().message);
        edit(target, fmt::format("❌ Download failed: {}\n💾 Disk error occurred", finalName));
        stage_ = DownloadStage::Failed;
        return closed.error();
    }

    reporter.emitSummary();
    stage_ = DownloadStage::Done;

    DownloadOutcome outcome{reporter.session().path, reporter.session().receivedBytes,
                            reporter.elapsed()};
    spdlog::info("Successfully downloaded: {} ({} bytes)", outcome.path.string(), outcome.bytes);
    return outcome;
}

} // namespace docdrop::download
