/**
 * @file image_builder.cpp
 * @brief Image freshness check and build
 *
 * @date 2025
 */

#include "sandbridge/core/image_builder.hpp"

#include "sandbridge/core/errors.hpp"
#include "sandbridge/utils/container_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <system_error>

namespace sandbridge {
namespace core {

namespace {

std::filesystem::path BuildContext(const std::filesystem::path& dockerfile) {
    auto parent = dockerfile.parent_path();
    return parent.empty() ? std::filesystem::path(".") : parent;
}

} // anonymous namespace

ImageBuilder::ImageBuilder(utils::ContainerEngine& engine)
    : engine_(engine) {}

BuildDecision ImageBuilder::Evaluate(const SandboxSpec& spec) const {
    if (spec.force_rebuild) {
        return BuildDecision::FORCED;
    }
    if (!engine_.ImageExists(spec.image_name)) {
        return BuildDecision::MISSING;
    }

    auto created = engine_.GetImageCreatedTime(spec.image_name);
    if (!created) {
        spdlog::debug("Creation time of {} unknown, assuming up to date", spec.image_name);
        return BuildDecision::UP_TO_DATE;
    }

    std::error_code ec;
    auto modified = std::filesystem::last_write_time(spec.dockerfile_path, ec);
    if (ec) {
        // Nothing to compare against; the existing image is all there is
        spdlog::debug("Cannot stat {}: {}", spec.dockerfile_path.string(), ec.message());
        return BuildDecision::UP_TO_DATE;
    }

    // file_clock and system_clock are not convertible in C++17
    const auto modified_system = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        modified - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());

    return modified_system > *created ? BuildDecision::STALE : BuildDecision::UP_TO_DATE;
}

BuildDecision ImageBuilder::EnsureImage(const SandboxSpec& spec) {
    BuildDecision decision;
    try {
        decision = Evaluate(spec);
    } catch (const EngineError& e) {
        throw ImageBuildError(e.what());
    }

    if (decision == BuildDecision::UP_TO_DATE) {
        spdlog::info("✓ Image {} is up to date", spec.image_name);
        return decision;
    }

    spdlog::info("Building image {} ({})", spec.image_name, DecisionToString(decision));

    if (!std::filesystem::exists(spec.dockerfile_path)) {
        throw ImageBuildError("image definition not found: " + spec.dockerfile_path.string());
    }

    try {
        engine_.BuildImage(spec.image_name, spec.dockerfile_path,
                           BuildContext(spec.dockerfile_path));
    } catch (const EngineError& e) {
        spdlog::error("Build of {} failed: {}", spec.image_name, e.what());
        throw ImageBuildError(e.what());
    }

    spdlog::info("✓ Image {} built successfully", spec.image_name);
    return decision;
}

std::string ImageBuilder::DecisionToString(BuildDecision decision) {
    switch (decision) {
        case BuildDecision::UP_TO_DATE: return "up to date";
        case BuildDecision::MISSING: return "image missing";
        case BuildDecision::FORCED: return "rebuild forced";
        case BuildDecision::STALE: return "definition changed";
        default: return "unknown";
    }
}

} // namespace core
} // namespace sandbridge
