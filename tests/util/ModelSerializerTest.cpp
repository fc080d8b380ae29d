#include <gtest/gtest.h>
#include <mxdiagram/core/Builders.h>
#include <mxdiagram/util/ModelSerializer.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace mxdiagram;

// ============================================================================
// ModelSerializerTest - JSON snapshot of a GraphModel
// ============================================================================

namespace {

GraphModel sampleModel() {
    GraphModel model = newGraph();
    model.grid = "1";
    model.background = "#eeeeee";

    Cell shape = newShape("n1", "1");
    shape.value = "Box";
    shape.style = Style{{"fillColor", "#fff"}, {"rounded", ""}};
    shape.geometry->width = "120";
    shape.geometry->height = "60";
    model.add(shape);

    Cell edge = newEdge("e1", "1", "n1", "n1");
    edge.geometry->point = MxPoint(5, 0, kTargetPointAs);
    model.add(edge);
    return model;
}

}  // namespace

TEST(ModelSerializerTest, ToJson_ContainsRequiredFields) {
    std::string json = ModelSerializer::toJson(sampleModel());

    EXPECT_NE(json.find("\"version\""), std::string::npos);
    EXPECT_NE(json.find("\"cells\""), std::string::npos);
    EXPECT_NE(json.find("\"canvas\""), std::string::npos);
    EXPECT_NE(json.find("\"fillColor\""), std::string::npos);
    EXPECT_EQ(json.find("\"pageWidth\""), std::string::npos);
}

TEST(ModelSerializerTest, FromJson_RestoresModelExactly) {
    GraphModel original = sampleModel();
    GraphModel restored = ModelSerializer::fromJson(ModelSerializer::toJson(original));

    // Unlike the XML style attribute, JSON keeps the style map as-is
    EXPECT_EQ(restored, original);
    EXPECT_FALSE(restored.findCell("n1")->style.contains(""));
}

TEST(ModelSerializerTest, FromJson_Invalid_Throws) {
    EXPECT_THROW(ModelSerializer::fromJson("{not json"), std::runtime_error);
}

TEST(ModelSerializerTest, FromJson_MissingSections_UsesDefaults) {
    GraphModel model = ModelSerializer::fromJson(R"({"dx": 10})");
    EXPECT_EQ(model.dx, 10);
    EXPECT_EQ(model.dy, 0);
    EXPECT_EQ(model.cellCount(), 0u);
}

TEST(ModelSerializerTest, SaveAndLoadFile) {
    const std::string path = ::testing::TempDir() + "mxdiagram_model.json";
    GraphModel original = sampleModel();

    ASSERT_TRUE(ModelSerializer::saveToFile(original, path));

    GraphModel loaded;
    ASSERT_TRUE(ModelSerializer::loadFromFile(loaded, path));
    EXPECT_EQ(loaded, original);

    std::remove(path.c_str());
}

TEST(ModelSerializerTest, SaveToFile_WriteFailure_ReturnsFalse) {
    std::ifstream device("/dev/full");
    if (!device.is_open()) {
        GTEST_SKIP() << "/dev/full not available";
    }
    EXPECT_FALSE(ModelSerializer::saveToFile(sampleModel(), "/dev/full"));
}

TEST(ModelSerializerTest, LoadFromFile_Missing_LeavesModelUntouched) {
    GraphModel model = newGraph();
    EXPECT_FALSE(ModelSerializer::loadFromFile(model, "/nonexistent-dir/model.json"));
    EXPECT_EQ(model, newGraph());
}
