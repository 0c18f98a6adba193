/**
 * @file main.cpp
 * @brief SandBridge - Command-line interface
 *
 * Starts a sandbox container (building its image when needed), connects the
 * control channel to it and forwards code either once (--message) or line
 * by line from stdin. The container is stopped and removed on exit.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "sandbridge/channel/control_channel.hpp"
#include "sandbridge/channel/readiness_probe.hpp"
#include "sandbridge/channel/sandbox_watch.hpp"
#include "sandbridge/channel/websocket_transport.hpp"
#include "sandbridge/config/config_loader.hpp"
#include "sandbridge/core/errors.hpp"
#include "sandbridge/core/sandbox_controller.hpp"
#include "sandbridge/monitor/status_reporter.hpp"
#include "sandbridge/utils/container_utils.hpp"
#include "sandbridge/utils/string_utils.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace sb = sandbridge;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

namespace {

/// Stream one request to stdout; true if it produced a result
bool RunCode(sb::channel::ControlChannel& channel, const std::string& code) {
    auto stream = channel.Submit(code);
    while (auto chunk = stream.Next()) {
        std::cout << *chunk << std::flush;
    }
    std::cout << "\n";

    auto outcome = stream.Wait();
    if (outcome.Succeeded()) {
        if (!outcome.value.is_null()) {
            std::cout << (outcome.value.is_string() ? outcome.value.get<std::string>()
                                                    : outcome.value.dump(2))
                      << std::endl;
        }
        return true;
    }

    spdlog::error("[{}] {}", sb::channel::RequestOutcome::KindToString(outcome.kind),
                  outcome.reason);
    return false;
}

void PrintStatus(sb::monitor::StatusReporter& reporter) {
    reporter.PollOnce();
    std::cout << reporter.ToJson().dump(2) << std::endl;
}

void RunInteractive(sb::channel::ControlChannel& channel, sb::monitor::StatusReporter& reporter) {
    std::cout << "Enter code to run in the sandbox ('status' for the dashboard, 'exit' to quit)\n";

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        const auto command = sb::utils::StringUtils::Trim(line);
        if (command.empty()) {
            continue;
        }
        if (command == "exit" || command == "quit") {
            break;
        }
        if (command == "status") {
            PrintStatus(reporter);
            continue;
        }
        if (channel.State() == sb::channel::ChannelState::CLOSED) {
            spdlog::error("Control channel closed: {}", channel.LastError());
            break;
        }

        RunCode(channel, command);
    }
}

/// Stop and remove the sandbox, logging (not throwing) failures
void Shutdown(sb::core::SandboxController& sandbox) {
    try {
        const auto state = sandbox.State();
        if (state == sb::core::SandboxState::RUNNING || state == sb::core::SandboxState::STARTING) {
            sandbox.Stop();
        }
        const auto final_state = sandbox.State();
        if (final_state == sb::core::SandboxState::CREATED ||
            final_state == sb::core::SandboxState::STOPPED ||
            final_state == sb::core::SandboxState::FAILED) {
            sandbox.Destroy();
        }
    } catch (const sb::SandboxError& e) {
        spdlog::error("[CLEANUP] {}", e.what());
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"SandBridge - remote code execution in a Docker sandbox"};

    std::string config_path;
    bool rebuild = false;
    std::string message;
    bool status = false;
    bool debug = false;

    std::string image;
    std::string dockerfile;
    double cpu_limit = 0.0;
    std::string memory_limit;
    int timeout_seconds = 0;
    int host_port = 0;
    int max_retries = 0;
    int retry_delay_ms = 0;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("--build", rebuild, "Force a rebuild of the sandbox image");
    app.add_option("-m,--message", message, "Run this code once and exit");
    app.add_flag("--status", status, "Print the dashboard status document after startup");
    app.add_flag("--debug", debug, "Enable debug logging");

    auto* image_opt = app.add_option("--image", image, "Sandbox image tag");
    auto* dockerfile_opt = app.add_option("--dockerfile", dockerfile, "Image definition")
        ->check(CLI::ExistingFile);
    auto* cpu_opt = app.add_option("--cpu", cpu_limit, "CPU limit (fractional CPUs)")
        ->check(CLI::PositiveNumber);
    auto* memory_opt = app.add_option("--memory", memory_limit, "Memory limit (e.g. 512m, 1g)");
    auto* timeout_opt = app.add_option("--timeout", timeout_seconds, "Execution timeout in seconds")
        ->check(CLI::PositiveNumber);
    auto* port_opt = app.add_option("--port", host_port, "Host port of the control endpoint")
        ->check(CLI::Range(1, 65535));
    auto* retries_opt = app.add_option("--max-retries", max_retries, "Connect attempts per cycle")
        ->check(CLI::PositiveNumber);
    auto* delay_opt = app.add_option("--retry-delay", retry_delay_ms, "Base retry delay in ms")
        ->check(CLI::NonNegativeNumber);

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    sb::config::AppConfig config;
    try {
        config = config_path.empty() ? sb::config::DefaultConfig()
                                     : sb::config::LoadConfig(config_path);

        // Command-line flags override the file
        auto& spec = config.sandbox;
        if (rebuild) spec.force_rebuild = true;
        if (debug) spec.debug = true;
        if (*image_opt) spec.image_name = image;
        if (*dockerfile_opt) spec.dockerfile_path = dockerfile;
        if (*cpu_opt) spec.limits.cpu_limit = cpu_limit;
        if (*memory_opt) {
            auto bytes = sb::utils::StringUtils::ParseByteSize(memory_limit);
            if (!bytes) {
                throw sb::ConfigError("invalid --memory value '" + memory_limit + "'");
            }
            spec.limits.memory_limit_bytes = *bytes;
        }
        if (*timeout_opt) {
            spec.limits.execution_timeout = std::chrono::seconds(timeout_seconds);
            config.channel.request_timeout = std::chrono::seconds(timeout_seconds);
        }
        if (*port_opt) {
            spec.host_port = static_cast<std::uint16_t>(host_port);
            config.channel.port = spec.host_port;
        }
        if (*retries_opt) config.channel.max_retries = max_retries;
        if (*delay_opt) config.channel.retry_delay = std::chrono::milliseconds(retry_delay_ms);

        sb::config::ValidateConfig(config);
    } catch (const sb::ConfigError& e) {
        spdlog::error("[CONFIG] {}", e.what());
        return 2;
    }

    if (debug || config.sandbox.debug) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::from_str(config.log.level));
    }
    spdlog::set_pattern(config.log.pattern);

    if (!sb::utils::DockerEngine::IsRuntimeAvailable()) {
        spdlog::error("[ERROR] Docker is not available; install it and make sure the daemon runs");
        return 1;
    }
    spdlog::info("[INIT] Docker {}", sb::utils::DockerEngine::GetRuntimeVersion());

    auto engine = std::make_shared<sb::utils::DockerEngine>();
    std::shared_ptr<sb::core::SandboxController> sandbox;

    int exit_code = 0;
    try {
        sandbox = std::make_shared<sb::core::SandboxController>(
            config.sandbox, engine, sb::channel::HandshakeProbe());

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        spdlog::info("[START] Sandbox {} (cpu {}, memory {}, pids {}, timeout {}s)",
                     config.sandbox.image_name,
                     config.sandbox.limits.cpu_limit,
                     sb::utils::StringUtils::FormatMegabytes(config.sandbox.limits.memory_limit_bytes),
                     config.sandbox.limits.max_processes,
                     config.sandbox.limits.execution_timeout.count());
        sandbox->EnsureRunning();
        spdlog::info("[READY] {}", sb::core::EndpointUrl(config.sandbox));

        sb::channel::ControlChannel channel(config.channel,
                                            std::make_unique<sb::channel::WebSocketTransport>());
        sb::channel::SandboxWatch watch(*sandbox, channel);
        channel.Open();

        sb::monitor::StatusReporter reporter(config.monitor);
        reporter.Track("default", sandbox);

        if (status) {
            PrintStatus(reporter);
        }

        if (!message.empty()) {
            exit_code = RunCode(channel, message) ? 0 : 1;
        } else if (!status) {
            RunInteractive(channel, reporter);
        }

        channel.Close();
    } catch (const sb::SandboxError& e) {
        spdlog::error("[ERROR] {}", e.what());
        exit_code = 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        exit_code = 1;
    }

    if (sandbox) {
        Shutdown(*sandbox);
    }

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    return exit_code;
}
