#include "affectscope/models/ModelCatalog.h"

#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>

using namespace affectscope;
using namespace affectscope::test;

TEST(ParseManifest, ReadsFieldsAndResolvesRelativePaths) {
    std::istringstream in(
        "# name artifact weight height width channels [rank]\n"
        "\n"
        "mini_xception  mini_xception.onnx 0.6 64 64 1   # grayscale\n"
        "vgg\t/opt/models/vgg.onnx\t0.4\t48\t48\t3\t3\n");

    const EnsembleConfig config = models::parse_manifest(in, "models");
    ASSERT_EQ(config.models.size(), 2u);

    const ModelDescriptor& first = config.models[0];
    EXPECT_EQ(first.name, "mini_xception");
    EXPECT_EQ(first.artifactPath, (std::filesystem::path("models") / "mini_xception.onnx").string());
    EXPECT_DOUBLE_EQ(first.weight, 0.6);
    EXPECT_EQ(first.inputShape, (InputShape{64, 64, 1, 4}));

    const ModelDescriptor& second = config.models[1];
    EXPECT_EQ(second.artifactPath, "/opt/models/vgg.onnx");
    EXPECT_EQ(second.inputShape, (InputShape{48, 48, 3, 3}));
}

TEST(ParseManifest, ReportsTheOffendingLine) {
    std::istringstream tooShort("a a.onnx 0.5 48 48 1\nb b.onnx 0.5 48\n");
    try {
        models::parse_manifest(tooShort, "");
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
    }

    std::istringstream badWeight("a a.onnx heavy 48 48 1\n");
    EXPECT_THROW(models::parse_manifest(badWeight, ""), std::runtime_error);

    std::istringstream badHeight("a a.onnx 0.5 tall 48 1\n");
    EXPECT_THROW(models::parse_manifest(badHeight, ""), std::runtime_error);
}

TEST(LoadCatalog, MissingManifestMeansNoModels) {
    ScopedTempDir dir;
    EXPECT_TRUE(models::load_catalog(dir.path().string()).models.empty());
}

TEST(LoadCatalog, SkipsModelsWithoutArtifacts) {
    ScopedTempDir dir;
    dir.write_file("present.onnx", "onnx");
    dir.write_file(models::kManifestFileName,
                   "present present.onnx 1.0 48 48 1\n"
                   "absent absent.onnx 0.5 48 48 1\n");

    const EnsembleConfig config = models::load_catalog(dir.path().string());
    ASSERT_EQ(config.models.size(), 1u);
    EXPECT_EQ(config.models[0].name, "present");
}
