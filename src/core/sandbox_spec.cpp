/**
 * @file sandbox_spec.cpp
 * @brief Sandbox spec validation and builder helpers
 *
 * @date 2025
 */

#include "sandbridge/core/sandbox_spec.hpp"

#include "sandbridge/core/errors.hpp"
#include "sandbridge/utils/string_utils.hpp"

namespace sandbridge {
namespace core {

namespace {

// Lowest --memory value the engine accepts
constexpr std::uint64_t kMinimumMemoryBytes = 4ULL * 1024 * 1024;

} // anonymous namespace

void ValidateSpec(const SandboxSpec& spec) {
    if (spec.image_name.empty()) {
        throw ConfigError("image name must not be empty");
    }
    if (spec.limits.cpu_limit <= 0.0) {
        throw ConfigError("cpu limit must be positive");
    }
    if (spec.limits.memory_limit_bytes < kMinimumMemoryBytes) {
        throw ConfigError("memory limit must be at least 4MB");
    }
    if (spec.limits.max_processes <= 0) {
        throw ConfigError("max processes must be positive");
    }
    if (spec.limits.execution_timeout.count() <= 0) {
        throw ConfigError("execution timeout must be positive");
    }
    if (spec.host.empty()) {
        throw ConfigError("host must not be empty");
    }
    if (spec.host_port == 0 || spec.container_port == 0) {
        throw ConfigError("ports must be non-zero");
    }
    if (spec.endpoint_path.empty() || spec.endpoint_path.front() != '/') {
        throw ConfigError("endpoint path must start with '/'");
    }
    if (spec.readiness_retries <= 0) {
        throw ConfigError("readiness retries must be positive");
    }
    if (spec.readiness_delay.count() < 0 || spec.probe_timeout.count() <= 0) {
        throw ConfigError("readiness delay and probe timeout must be non-negative");
    }
    if (spec.stop_grace.count() < 0) {
        throw ConfigError("stop grace period must be non-negative");
    }
}

std::string EndpointUrl(const SandboxSpec& spec) {
    return "ws://" + spec.host + ":" + std::to_string(spec.host_port) + spec.endpoint_path;
}

SandboxSpecBuilder& SandboxSpecBuilder::WithMemoryLimit(const std::string& size) {
    auto bytes = utils::StringUtils::ParseByteSize(size);
    if (!bytes) {
        throw ConfigError("invalid memory limit '" + size + "'");
    }
    spec_.limits.memory_limit_bytes = *bytes;
    return *this;
}

SandboxSpec SandboxSpecBuilder::Build() const {
    ValidateSpec(spec_);
    return spec_;
}

} // namespace core
} // namespace sandbridge
