#include <docdrop/app/agent.h>
#include <docdrop/app/logging.h>
#include <docdrop/auth/file_authenticator.h>
#include <docdrop/config/agent_config.h>
#include <docdrop/config/config_helpers.h>
#include <docdrop/download/format.h>
#include <docdrop/messenger/tdjson_client.h>
#include <docdrop/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>

namespace {

docdrop::app::Agent* g_agent = nullptr;

void stop_handler(int) {
    if (g_agent) {
        g_agent->requestStop();
    }
}

void install_stop_handlers(docdrop::app::Agent& agent) {
    g_agent = &agent;
    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);
}

void remove_stop_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_agent = nullptr;
}

void setup_fatal_handlers() {
    std::set_terminate([]() noexcept {
        std::fprintf(stderr, "FATAL: std::terminate called\n");
        spdlog::shutdown();
        std::_Exit(1);
    });
}

void log_startup(const docdrop::config::AgentConfig& cfg) {
    spdlog::info("docdrop {}", docdrop::version::long_string_v);
    spdlog::info("Download folder: {}", cfg.downloadRoot.string());
    spdlog::info("Allowed user ID: {}", cfg.allowedUserId);
    if (cfg.containerId) {
        spdlog::info("Monitoring channel/group: {}", *cfg.containerId);
    } else {
        spdlog::info("Monitoring private messages");
    }
    if (cfg.allowedExtensions.empty()) {
        spdlog::info("All file types allowed");
    } else {
        spdlog::info("Allowed file types: {}", docdrop::config::join(cfg.allowedExtensions));
    }
    spdlog::info("File size limit: {}", docdrop::download::formatBytes(cfg.maxFileBytes));
    spdlog::info("Session: {}", cfg.sessionPath.string());
    spdlog::debug("Code file: {}, password file: {}", cfg.codeFile.string(),
                  cfg.passwordFile.string());
}

} // namespace

int main(int argc, char* argv[]) {
    setup_fatal_handlers();

    CLI::App app{"docdrop - download documents sent by one trusted user to a local folder"};
    app.set_version_flag("--version", DOCDROP_VERSION_STRING);

    docdrop::config::CliOptions options;
    docdrop::config::registerAgentOptions(app, options);

    CLI11_PARSE(app, argc, argv);

    auto resolved = docdrop::config::resolveAgentConfig(options);
    if (!resolved) {
        spdlog::critical("{}", resolved.error().message);
        return 1;
    }
    const auto config = std::move(resolved).value();

    if (auto r = docdrop::app::configureLogging(config); !r) {
        spdlog::critical("{}", r.error().message);
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.downloadRoot, ec);
    if (ec) {
        spdlog::critical("Failed to create download folder {}: {}", config.downloadRoot.string(),
                         ec.message());
        return 1;
    }

    log_startup(config);

    docdrop::messenger::TdJsonOptions tdOptions;
    tdOptions.apiId = config.apiId;
    tdOptions.apiHash = config.apiHash;
    tdOptions.databaseDirectory = config.sessionPath;
    tdOptions.logVerbosity = config.debug ? 2 : 1;

    docdrop::messenger::TdJsonClient client(std::move(tdOptions));
    docdrop::auth::FileAuthenticator authenticator(config);
    docdrop::app::Agent agent(config, client, authenticator);

    install_stop_handlers(agent);

    int exitCode = 0;
    if (auto started = agent.start(); !started) {
        spdlog::critical("Agent error: {}", started.error().message);
        exitCode = 1;
    } else {
        agent.run();
        spdlog::info("Shutdown requested, stopping");
    }

    client.shutdown();
    remove_stop_handlers();
    spdlog::shutdown();
    return exitCode;
}
