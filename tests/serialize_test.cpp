#include "photogrid/serialize.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

using grid::Dimension;
using nlohmann::json;
using photogrid::BreakpointContext;
using photogrid::ResponsivePhotoGrid;
using photogrid::SerializeError;

using NamedGrid = ResponsivePhotoGrid<std::string>;

NamedGrid Sample() {
    std::vector<std::string> names = { "a", "b", "c", "d" };
    return NamedGrid(names, { 3, 4 }, [](const std::string& name, BreakpointContext ctx) {
        if (name == "a" || name == "b") return Dimension{ 2, 1 };
        return Dimension{ 1, std::min<std::size_t>(ctx.columns, 2) };
    });
}

// One breakpoint of the given width holding `placements`, over `data`.
json Doc(const std::string& placements, std::size_t width, const std::string& data) {
    return json::parse(R"({"breakpoints":[{"placements":)" + placements + R"(,"width":)" +
                       std::to_string(width) + R"(}],"data":)" + data + "}");
}

std::string Cell(std::size_t id, std::size_t x, std::size_t y, std::size_t w, std::size_t h) {
    return R"({"data":)" + std::to_string(id) + R"(,"size":{"width":)" + std::to_string(w) +
           R"(,"height":)" + std::to_string(h) + R"(},"origin":{"x":)" + std::to_string(x) +
           R"(,"y":)" + std::to_string(y) + "}}";
}

std::string TempPath(const std::string& name) {
    return ::testing::TempDir() + name;
}

TEST(SerializeTest, DocumentShape) {
    const json j = Sample();
    ASSERT_TRUE(j.contains("breakpoints"));
    ASSERT_TRUE(j.contains("data"));
    EXPECT_EQ(j["data"], json::parse(R"(["a","b","c","d"])"));
    ASSERT_EQ(j["breakpoints"].size(), 2u);

    const json& first = j["breakpoints"][0];
    EXPECT_EQ(first["width"], 3);
    ASSERT_EQ(first["placements"].size(), 4u);
    EXPECT_EQ(first["placements"][0], json::parse(Cell(0, 0, 0, 2, 1)));
}

TEST(SerializeTest, JsonRoundTrip) {
    const NamedGrid g = Sample();
    const json j = g;
    EXPECT_EQ(j.get<NamedGrid>(), g);

    const NamedGrid back = json::parse(photogrid::encode(g, photogrid::Format::Json)).get<NamedGrid>();
    EXPECT_EQ(back, g);
    ASSERT_EQ(back.contents_at(2).size(), 2u);
    EXPECT_EQ(*back.contents_at(2)[0].item, "c");
}

TEST(SerializeTest, CborRoundTrip) {
    const NamedGrid g = Sample();
    const std::vector<std::uint8_t> bytes = photogrid::to_cbor(g);
    EXPECT_LT(bytes.size(), photogrid::encode(g, photogrid::Format::Json).size());
    EXPECT_EQ(photogrid::from_cbor<std::string>(bytes), g);
}

TEST(SerializeTest, MalformedCborThrows) {
    const std::vector<std::uint8_t> bytes = { 0xff, 0x00, 0x13 };
    EXPECT_THROW(photogrid::from_cbor<std::string>(bytes), SerializeError);
}

TEST(SerializeTest, AcceptsValidHandWrittenDocument) {
    const json doc = Doc("[" + Cell(1, 0, 0, 1, 2) + "," + Cell(0, 1, 0, 1, 1) + "]", 2, R"(["x","y"])");
    const NamedGrid g = doc.get<NamedGrid>();
    EXPECT_EQ(g.contents_len(), 2u);
    EXPECT_EQ(g.contents_at(1)[0].placement->size, (Dimension{ 1, 2 }));
}

TEST(SerializeTest, RejectsMissingKeys) {
    EXPECT_THROW(json::parse(R"({"data":[]})").get<NamedGrid>(), SerializeError);
    EXPECT_THROW(json::parse(R"({"breakpoints":[]})").get<NamedGrid>(), SerializeError);
    EXPECT_THROW(json::parse(R"({"breakpoints":[{"width":2}],"data":[]})").get<NamedGrid>(), SerializeError);
}

TEST(SerializeTest, RejectsWrongPlacementCount) {
    EXPECT_THROW(Doc("[" + Cell(0, 0, 0, 1, 1) + "]", 2, R"(["x","y"])").get<NamedGrid>(), SerializeError);
}

TEST(SerializeTest, RejectsOrdinalOutOfRange) {
    EXPECT_THROW(Doc("[" + Cell(3, 0, 0, 1, 1) + "]", 2, R"(["x"])").get<NamedGrid>(), SerializeError);
}

TEST(SerializeTest, RejectsDuplicateOrdinal) {
    EXPECT_THROW(Doc("[" + Cell(0, 0, 0, 1, 1) + "," + Cell(0, 1, 0, 1, 1) + "]", 2, R"(["x","y"])")
                     .get<NamedGrid>(),
                 SerializeError);
}

TEST(SerializeTest, RejectsEmptySpan) {
    EXPECT_THROW(Doc("[" + Cell(0, 0, 0, 0, 1) + "]", 2, R"(["x"])").get<NamedGrid>(), SerializeError);
}

TEST(SerializeTest, RejectsRightEdgeOverflow) {
    EXPECT_THROW(Doc("[" + Cell(0, 1, 0, 2, 1) + "]", 2, R"(["x"])").get<NamedGrid>(), SerializeError);
}

TEST(SerializeTest, RejectsNegativeOrigin) {
    const std::string left = R"({"data":0,"size":{"width":1,"height":1},"origin":{"x":-1,"y":0}})";
    EXPECT_THROW(Doc("[" + left + "]", 4, "[7]").get<ResponsivePhotoGrid<int>>(), SerializeError);

    const std::string up = R"({"data":0,"size":{"width":1,"height":1},"origin":{"x":0,"y":-1}})";
    EXPECT_THROW(Doc("[" + up + "]", 4, "[7]").get<ResponsivePhotoGrid<int>>(), SerializeError);
}

TEST(SerializeTest, RejectsSpanWiderThanGrid) {
    const std::string wide = R"({"data":0,"size":{"width":-1,"height":1},"origin":{"x":1,"y":0}})";
    EXPECT_THROW(Doc("[" + wide + "]", 4, R"(["x"])").get<NamedGrid>(), SerializeError);
}

TEST(SerializeTest, FarRowsDoNotOverlap) {
    const auto g = Doc("[" + Cell(0, 0, 0, 2, 1) + "," + Cell(1, 0, 1000000000, 2, 1) + "]", 2, R"(["x","y"])")
                       .get<NamedGrid>();
    EXPECT_EQ(g.breakpoints()[0].rows(), 1000000001u);
}

TEST(SerializeTest, RejectsOverlap) {
    try {
        Doc("[" + Cell(0, 0, 0, 2, 2) + "," + Cell(1, 1, 1, 1, 1) + "]", 2, R"(["x","y"])").get<NamedGrid>();
        FAIL() << "overlapping placements were accepted";
    } catch (const SerializeError& e) {
        EXPECT_NE(std::string(e.what()).find("overlap"), std::string::npos) << e.what();
    }
}

TEST(SerializeTest, DimensionTextForm) {
    EXPECT_EQ(json("1920x1080").get<Dimension>(), (Dimension{ 1920, 1080 }));
    EXPECT_EQ(json::parse(R"({"width":3,"height":2})").get<Dimension>(), (Dimension{ 3, 2 }));
    EXPECT_THROW(json("1920:1080").get<Dimension>(), grid::TextFormatError);

    EXPECT_EQ(json("3:2").get<grid::AspectRatio>(), (grid::AspectRatio{ 3, 2 }));
    try {
        json("3:2:1").get<grid::AspectRatio>();
        FAIL() << "trailing content was accepted";
    } catch (const grid::TextFormatError& e) {
        EXPECT_EQ(e.error().kind, grid::ParseErrorKind::Separator);
    }
}

TEST(SerializeTest, BadTextFormInsideDocument) {
    const std::string cell = R"({"data":0,"size":"1by1","origin":{"x":0,"y":0}})";
    EXPECT_THROW(Doc("[" + cell + "]", 2, R"(["x"])").get<NamedGrid>(), SerializeError);
}

TEST(SerializeTest, SaveAndLoadJson) {
    const std::string path = TempPath("photogrid_serialize.json");
    const NamedGrid g = Sample();
    ASSERT_TRUE(photogrid::save(path, g));

    NamedGrid loaded;
    ASSERT_TRUE(photogrid::load(path, loaded));
    EXPECT_EQ(loaded, g);
    std::remove(path.c_str());
}

TEST(SerializeTest, SaveAndLoadCbor) {
    const std::string path = TempPath("photogrid_serialize.cbor");
    const NamedGrid g = Sample();
    ASSERT_TRUE(photogrid::save(path, g, photogrid::Format::Cbor));

    NamedGrid loaded;
    ASSERT_TRUE(photogrid::load(path, loaded, photogrid::Format::Cbor));
    EXPECT_EQ(loaded, g);

    NamedGrid as_json;
    EXPECT_FALSE(photogrid::load(path, as_json, photogrid::Format::Json));
    std::remove(path.c_str());
}

TEST(SerializeTest, LoadFailureLeavesOutputUntouched) {
    const NamedGrid g = Sample();
    NamedGrid out = g;
    EXPECT_FALSE(photogrid::load(TempPath("photogrid_does_not_exist.json"), out));
    EXPECT_EQ(out, g);

    const std::string path = TempPath("photogrid_invalid.json");
    {
        std::ofstream f(path);
        f << Doc("[" + Cell(0, 0, 0, 3, 1) + "]", 2, R"(["x"])").dump();
    }
    EXPECT_FALSE(photogrid::load(path, out));
    EXPECT_EQ(out, g);
    std::remove(path.c_str());
}

TEST(SerializeTest, SaveToUnwritablePathFails) {
    EXPECT_FALSE(photogrid::save(TempPath("no_such_dir/grid.json"), Sample()));
}

} // namespace
