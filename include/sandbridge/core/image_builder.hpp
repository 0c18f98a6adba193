/**
 * @file image_builder.hpp
 * @brief Ensures the sandbox image exists and is up to date
 *
 * The image is rebuilt when it is missing, when a rebuild is forced, or when
 * the image definition was modified after the image was created. The build
 * context is the directory holding the image definition.
 *
 * @date 2025
 */

#pragma once

#include "sandbridge/core/sandbox_spec.hpp"

#include <string>

namespace sandbridge {

namespace utils {
class ContainerEngine;
}

namespace core {

/**
 * @enum BuildDecision
 * @brief Why an image was (or was not) built
 */
enum class BuildDecision {
    UP_TO_DATE,  ///< Image present and newer than its definition
    MISSING,     ///< Image absent
    FORCED,      ///< Rebuild requested
    STALE        ///< Definition modified after the image was created
};

/**
 * @class ImageBuilder
 * @brief Builds the sandbox image on demand
 *
 * **Usage Example**:
 * @code
 * utils::DockerEngine docker;
 * ImageBuilder builder(docker);
 * builder.EnsureImage(spec);   // throws ImageBuildError on failure
 * @endcode
 */
class ImageBuilder {
public:
    explicit ImageBuilder(utils::ContainerEngine& engine);

    /**
     * @brief Decide whether the sandbox image needs a build
     * @throws EngineError if the engine cannot be queried
     */
    BuildDecision Evaluate(const SandboxSpec& spec) const;

    /**
     * @brief Build the image if Evaluate() says so
     * @return The decision that was acted on
     * @throws ImageBuildError if the definition is missing or the build fails
     */
    BuildDecision EnsureImage(const SandboxSpec& spec);

    static std::string DecisionToString(BuildDecision decision);

private:
    utils::ContainerEngine& engine_;  ///< Engine used for queries and builds
};

} // namespace core
} // namespace sandbridge
