#include <gtest/gtest.h>
#include "fakes.hpp"
#include "sandbridge/core/errors.hpp"
#include "sandbridge/core/image_builder.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

using namespace sandbridge;
using namespace sandbridge::core;
using sandbridge::test::FakeEngine;

class ImageBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("sandbridge_image_" + std::to_string(rd()));
        fs::create_directories(dir_);

        dockerfile_ = dir_ / "Dockerfile";
        std::ofstream(dockerfile_) << "FROM python:3.11-slim\n";

        spec_.image_name = "sandbox-image";
        spec_.dockerfile_path = dockerfile_;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path dockerfile_;
    SandboxSpec spec_;
    FakeEngine engine_;
};

TEST_F(ImageBuilderTest, UpToDateImageIsNotRebuilt) {
    // Given: An image created after the Dockerfile was written
    engine_.image_created = std::chrono::system_clock::now() + std::chrono::hours(1);

    ImageBuilder builder(engine_);
    EXPECT_EQ(builder.EnsureImage(spec_), BuildDecision::UP_TO_DATE);
    EXPECT_EQ(engine_.builds, 0);
}

TEST_F(ImageBuilderTest, UnknownCreationTimeCountsAsUpToDate) {
    engine_.image_created.reset();

    ImageBuilder builder(engine_);
    EXPECT_EQ(builder.Evaluate(spec_), BuildDecision::UP_TO_DATE);
}

TEST_F(ImageBuilderTest, MissingImageIsBuilt) {
    engine_.image_exists = false;

    ImageBuilder builder(engine_);
    EXPECT_EQ(builder.EnsureImage(spec_), BuildDecision::MISSING);
    EXPECT_EQ(engine_.builds, 1);
    EXPECT_EQ(engine_.last_build_context, dir_) << "Build context must be the Dockerfile directory";
}

TEST_F(ImageBuilderTest, ForcedRebuildWinsOverFreshImage) {
    engine_.image_created = std::chrono::system_clock::now() + std::chrono::hours(1);
    spec_.force_rebuild = true;

    ImageBuilder builder(engine_);
    EXPECT_EQ(builder.EnsureImage(spec_), BuildDecision::FORCED);
    EXPECT_EQ(engine_.builds, 1);
}

TEST_F(ImageBuilderTest, EditedDockerfileMakesImageStale) {
    // Given: An image built an hour before the Dockerfile's last edit
    engine_.image_created = std::chrono::system_clock::now() - std::chrono::hours(1);

    ImageBuilder builder(engine_);
    EXPECT_EQ(builder.EnsureImage(spec_), BuildDecision::STALE);
    EXPECT_EQ(engine_.builds, 1);
}

TEST_F(ImageBuilderTest, MissingDockerfileFailsBuild) {
    engine_.image_exists = false;
    spec_.dockerfile_path = dir_ / "Nonexistent.Dockerfile";

    ImageBuilder builder(engine_);
    EXPECT_THROW(builder.EnsureImage(spec_), ImageBuildError);
    EXPECT_EQ(engine_.builds, 0);
}

TEST_F(ImageBuilderTest, EngineBuildFailureIsImageBuildError) {
    engine_.image_exists = false;
    engine_.fail_build = true;

    ImageBuilder builder(engine_);
    try {
        builder.EnsureImage(spec_);
        FAIL() << "Build failure not reported";
    } catch (const ImageBuildError& e) {
        EXPECT_NE(std::string(e.what()).find("RUN step returned 1"), std::string::npos)
            << "Build output should reach the caller";
    }
}

TEST_F(ImageBuilderTest, UnreachableEngineIsImageBuildError) {
    engine_.fail_image_query = true;

    ImageBuilder builder(engine_);
    EXPECT_THROW(builder.EnsureImage(spec_), ImageBuildError);
}

TEST(ImageBuilderDecisionTest, DecisionNames) {
    EXPECT_EQ(ImageBuilder::DecisionToString(BuildDecision::STALE), "definition changed");
    EXPECT_EQ(ImageBuilder::DecisionToString(BuildDecision::MISSING), "image missing");
}
