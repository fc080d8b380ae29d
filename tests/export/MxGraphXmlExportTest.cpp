#include <gtest/gtest.h>
#include <mxdiagram/mxdiagram.h>

#include <pugixml.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <vector>

using namespace mxdiagram;

// ============================================================================
// MxGraphXmlExportTest - mxGraphModel file output
// ============================================================================

namespace {

void parse(pugi::xml_document& doc, const std::string& xml) {
    pugi::xml_parse_result result = doc.load_string(xml.c_str());
    ASSERT_TRUE(result) << result.description() << "\n" << xml;
}

}  // namespace

TEST(MxGraphXmlExportTest, NewGraph_ProducesRootAndLayer) {
    MxGraphXmlExport xml;
    std::string output = xml.exportToString(newGraph());

    pugi::xml_document doc;
    parse(doc, output);
    pugi::xml_node graph = doc.child("mxGraphModel");
    ASSERT_TRUE(graph);
    EXPECT_EQ(graph.attribute("dx").as_int(), 640);
    EXPECT_EQ(graph.attribute("dy").as_int(), 480);
    EXPECT_FALSE(graph.attribute("grid"));

    pugi::xml_node root = graph.child("root");
    ASSERT_TRUE(root);

    pugi::xml_node canvas = root.first_child();
    EXPECT_STREQ(canvas.name(), "mxCell");
    EXPECT_STREQ(canvas.attribute("id").as_string(), "0");
    EXPECT_STREQ(canvas.attribute("style").as_string(), "html=1;");
    EXPECT_FALSE(canvas.attribute("parent"));

    pugi::xml_node layer = canvas.next_sibling();
    EXPECT_STREQ(layer.attribute("id").as_string(), "1");
    EXPECT_STREQ(layer.attribute("parent").as_string(), "0");
    EXPECT_STREQ(layer.attribute("style").as_string(), "html=1;");
    EXPECT_FALSE(layer.next_sibling());
}

TEST(MxGraphXmlExportTest, ZeroDxDy_StillWritten) {
    MxGraphXmlExport xml;
    pugi::xml_document doc;
    parse(doc, xml.exportToString(GraphModel{}));

    pugi::xml_node graph = doc.child("mxGraphModel");
    ASSERT_TRUE(graph.attribute("dx"));
    ASSERT_TRUE(graph.attribute("dy"));
    EXPECT_EQ(graph.attribute("dx").as_int(), 0);
    EXPECT_TRUE(graph.child("root"));
}

TEST(MxGraphXmlExportTest, CanvasAttributes_WrittenWhenSet) {
    GraphModel model = newGraph();
    model.grid = "1";
    model.pageWidth = "827";
    model.background = "#ffffff";

    MxGraphXmlExport xml;
    pugi::xml_document doc;
    parse(doc, xml.exportToString(model));
    pugi::xml_node graph = doc.child("mxGraphModel");

    EXPECT_STREQ(graph.attribute("grid").as_string(), "1");
    EXPECT_STREQ(graph.attribute("pageWidth").as_string(), "827");
    EXPECT_STREQ(graph.attribute("background").as_string(), "#ffffff");
    EXPECT_FALSE(graph.attribute("pageHeight"));
    EXPECT_FALSE(graph.attribute("math"));
}

TEST(MxGraphXmlExportTest, GeometryZeroCoordinates_Omitted) {
    GraphModel model = newGraph();
    Cell shape = newShape("n1", "1");
    shape.geometry->x = 0;
    shape.geometry->y = 25;
    model.add(shape);

    MxGraphXmlExport xml;
    pugi::xml_document doc;
    parse(doc, xml.exportToString(model));
    pugi::xml_node geometry = doc.select_node("//mxCell[@id='n1']/mxGeometry").node();

    ASSERT_TRUE(geometry);
    EXPECT_FALSE(geometry.attribute("x"));
    EXPECT_EQ(geometry.attribute("y").as_int(), 25);
    EXPECT_FALSE(geometry.attribute("width"));
    EXPECT_FALSE(geometry.attribute("relative"));
    EXPECT_STREQ(geometry.attribute("as").as_string(), "geometry");
}

TEST(MxGraphXmlExportTest, EdgeWithPoint_WritesAllParts) {
    GraphModel model = newGraph();
    Cell edge = newEdge("e1", "1", "a", "b");
    edge.geometry->point = MxPoint(0, 40, kSourcePointAs);
    model.add(edge);

    MxGraphXmlExport xml;
    pugi::xml_document doc;
    parse(doc, xml.exportToString(model));
    pugi::xml_node cell = doc.select_node("//mxCell[@id='e1']").node();

    ASSERT_TRUE(cell);
    EXPECT_STREQ(cell.attribute("edge").as_string(), "1");
    EXPECT_FALSE(cell.attribute("vertex"));
    EXPECT_STREQ(cell.attribute("source").as_string(), "a");
    EXPECT_STREQ(cell.attribute("target").as_string(), "b");
    EXPECT_FALSE(cell.attribute("style"));
    EXPECT_FALSE(cell.attribute("value"));

    pugi::xml_node point = cell.child("mxGeometry").child("mxPoint");
    ASSERT_TRUE(point);
    EXPECT_FALSE(point.attribute("x"));
    EXPECT_EQ(point.attribute("y").as_int(), 40);
    EXPECT_STREQ(point.attribute("as").as_string(), "sourcePoint");
}

TEST(MxGraphXmlExportTest, CellAttributes_InWireOrder) {
    GraphModel model;
    Cell cell = newShape("n1", "1");
    cell.value = "Label";
    cell.style.set("rounded", "1");
    model.add(cell);

    MxGraphXmlExport xml;
    pugi::xml_document doc;
    parse(doc, xml.exportToString(model));
    pugi::xml_node node = doc.select_node("//mxCell").node();

    std::vector<std::string> names;
    for (pugi::xml_attribute attr : node.attributes()) {
        names.emplace_back(attr.name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"id", "value", "style", "parent", "vertex"}));
}

TEST(MxGraphXmlExportTest, SpecialCharacters_AreEscaped) {
    GraphModel model = newGraph();
    Cell cell = newShape("n1", "1");
    cell.value = "<b>A & B</b> \"quoted\"";
    model.add(cell);

    MxGraphXmlExport xml;
    std::string output = xml.exportToString(model);

    EXPECT_EQ(output.find("<b>"), std::string::npos);
    pugi::xml_document doc;
    parse(doc, output);
    pugi::xml_node node = doc.select_node("//mxCell[@id='n1']").node();
    EXPECT_STREQ(node.attribute("value").as_string(), "<b>A & B</b> \"quoted\"");
}

TEST(MxGraphXmlExportTest, Options_ControlDeclarationAndLayout) {
    MxGraphXmlOptions options;
    options.xmlDeclaration = true;
    options.rawOutput = true;

    MxGraphXmlExport xml(options);
    std::string output = xml.exportToString(newGraph());

    EXPECT_EQ(output.rfind("<?xml", 0), 0u);
    EXPECT_EQ(output.find('\n'), std::string::npos);

    MxGraphXmlExport plain;
    std::string indented = plain.exportToString(newGraph());
    EXPECT_EQ(indented.rfind("<mxGraphModel", 0), 0u);
    EXPECT_NE(indented.find("\n  <root>"), std::string::npos);
}

TEST(MxGraphXmlExportTest, ExportToStream_MatchesString) {
    GraphModel model = newGraph();
    model.add(newImage("img", "1", "http://x/img.png"));

    MxGraphXmlExport xml;
    std::ostringstream out;
    xml.exportToStream(model, out);
    EXPECT_EQ(out.str(), xml.exportToString(model));
}

TEST(MxGraphXmlExportTest, ExportToFile_WritesDocument) {
    const std::string path = ::testing::TempDir() + "mxdiagram_export_test.drawio";

    MxGraphXmlExport xml;
    ASSERT_TRUE(xml.exportToFile(newGraph(), path));

    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    EXPECT_EQ(buffer.str(), xml.exportToString(newGraph()));

    std::remove(path.c_str());
}

TEST(MxGraphXmlExportTest, ExportToFile_BadPath_ReturnsFalse) {
    MxGraphXmlExport xml;
    EXPECT_FALSE(xml.exportToFile(newGraph(), "/nonexistent-dir/sub/out.drawio"));
}

TEST(MxGraphXmlExportTest, ExportToFile_WriteFailure_ReturnsFalse) {
    // /dev/full accepts the open but fails every write with ENOSPC
    std::ifstream device("/dev/full");
    if (!device.is_open()) {
        GTEST_SKIP() << "/dev/full not available";
    }

    MxGraphXmlExport xml;
    EXPECT_FALSE(xml.exportToFile(newGraph(), "/dev/full"));
}

TEST(MxGraphXmlExportTest, FormatMetadata) {
    MxGraphXmlExport xml;
    EXPECT_EQ(xml.fileExtension(), "drawio");
    EXPECT_EQ(xml.mimeType(), "application/xml");
}
