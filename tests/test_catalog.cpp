// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_catalog.cpp
 *
 * Tests for scene filters, point datasets and the manifest catalog.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "floodfusion/errors.hpp"
#include "floodfusion/imagery/catalog.hpp"
#include "floodfusion/io/npz.hpp"

using namespace floodfusion;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

Scene makeScene(const std::string& id, const std::string& date,
                const grid_map::Position& center) {
  Scene scene;
  scene.id = id;
  scene.date = parseDate(date);
  scene.properties["instrumentMode"] = "IW";
  scene.properties["orbitProperties_pass"] = "DESCENDING";
  scene.list_properties["transmitterReceiverPolarisation"] = {"VV", "VH"};
  scene.raster = Raster(100.0f, 100.0f, 10.0f, "EPSG:32645", center);
  scene.raster.addBand(band::VV, -10.0f);
  return scene;
}

std::string writeTempFile(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream fs(path);
  fs << content;
  return path.string();
}

}  // namespace

// ─── SceneCollection ────────────────────────────────────────────────────────

class SceneCollectionTest : public ::testing::Test {
 protected:
  SceneCollection collection;

  void SetUp() override {
    collection.add(makeScene("a", "2021-06-05", grid_map::Position(0, 0)));
    collection.add(makeScene("b", "2021-07-10", grid_map::Position(0, 0)));
    collection.add(makeScene("c", "2021-08-01", grid_map::Position(0, 0)));
    collection.add(makeScene("far", "2021-06-20", grid_map::Position(5000, 0)));
  }
};

TEST_F(SceneCollectionTest, FilterDate) {
  const auto window =
      makeTimeWindow(parseDate("2021-06-01"), parseDate("2021-07-31"));
  const auto filtered = collection.filterDate(window);
  ASSERT_EQ(filtered.size(), 3u);
  EXPECT_EQ(filtered.scenes()[0].id, "a");
  EXPECT_EQ(filtered.scenes()[2].id, "far");
  EXPECT_EQ(collection.size(), 4u);
}

TEST_F(SceneCollectionTest, FilterBounds) {
  const auto aoi = AreaOfInterest::rectangle(grid_map::Position(-20, -20),
                                             grid_map::Position(20, 20));
  const auto filtered = collection.filterBounds(aoi);
  EXPECT_EQ(filtered.size(), 3u);
  for (const auto& scene : filtered) EXPECT_NE(scene.id, "far");
}

TEST_F(SceneCollectionTest, FilterProperties) {
  Scene ascending = makeScene("asc", "2021-06-06", grid_map::Position(0, 0));
  ascending.properties["orbitProperties_pass"] = "ASCENDING";
  ascending.list_properties["transmitterReceiverPolarisation"] = {"VV"};
  collection.add(ascending);

  EXPECT_EQ(collection.filterEquals("orbitProperties_pass", "DESCENDING").size(),
            4u);
  EXPECT_EQ(collection.filterListContains("transmitterReceiverPolarisation",
                                          "VH")
                .size(),
            4u);
  EXPECT_EQ(collection.filterEquals("unknown", "x").size(), 0u);
}

TEST_F(SceneCollectionTest, MapTransformsRasters) {
  const auto mapped = collection.map([](const Scene& scene) {
    Raster out = scene.raster;
    out.get(band::VV).array() += 1.0f;
    return out;
  });
  ASSERT_EQ(mapped.size(), collection.size());
  EXPECT_FLOAT_EQ(mapped.scenes()[0].raster.valueAt(band::VV,
                                                    grid_map::Position(0, 0)),
                  -9.0f);
  EXPECT_EQ(mapped.scenes()[0].id, "a");
}

// ─── PointDataset ───────────────────────────────────────────────────────────

TEST(PointDatasetTest, ParseYaml) {
  const auto root = YAML::Load(
      "frame_id: EPSG:32645\n"
      "features:\n"
      "  - {id: p0, x: 1.0, y: 2.0, properties: {Planet_flo: 1, "
      "'system:index': 0}}\n"
      "  - {x: 3.0, y: 4.0, properties: {Planet_flo: 0, name: river}}\n");
  const PointDataset points = parsePointDataset(root);

  ASSERT_EQ(points.size(), 2u);
  EXPECT_EQ(points.frameId(), "EPSG:32645");
  EXPECT_EQ(points.points()[0].id, "p0");
  EXPECT_EQ(points.points()[1].id, "1");
  EXPECT_DOUBLE_EQ(points.points()[1].position.y(), 4.0);
  // Non-numeric property kept as text, not as a label value
  EXPECT_EQ(points.points()[1].properties.count("name"), 0u);
  ASSERT_EQ(points.points()[1].text_properties.count("name"), 1u);
  EXPECT_EQ(points.points()[1].text_properties.at("name"), "river");

  const auto names = points.listProperties();
  ASSERT_EQ(names.size(), 1u);
  EXPECT_EQ(names[0], "Planet_flo");
  EXPECT_TRUE(points.hasProperty("Planet_flo"));
  EXPECT_TRUE(points.hasProperty("name"));
  EXPECT_FALSE(points.hasProperty("class"));
}

TEST(PointDatasetTest, TextColumnsAreListed) {
  const auto root = YAML::Load(
      "features:\n"
      "  - {x: 1.0, y: 2.0, properties: {Planet_flo: 1, region: delta, "
      "'system:index': idx0}}\n");
  const PointDataset points = parsePointDataset(root);

  const auto names = points.listProperties();
  EXPECT_EQ(names, (std::vector<std::string>{"Planet_flo", "region"}));
}

TEST(PointDatasetTest, MissingCoordinatesThrow) {
  const auto root = YAML::Load("features:\n  - {id: p0, x: 1.0}\n");
  EXPECT_THROW(parsePointDataset(root), std::runtime_error);
  EXPECT_THROW(parsePointDataset(YAML::Load("frame_id: x\n")),
               std::runtime_error);
}

// ─── Catalogs ───────────────────────────────────────────────────────────────

TEST(InMemoryCatalogTest, LookupsAndRequire) {
  auto catalog = std::make_shared<InMemoryCatalog>();
  catalog->addScene("S1", makeScene("a", "2021-06-05", grid_map::Position(0, 0)))
      .addImage("DEM", Raster(10.0f, 10.0f, 1.0f, "EPSG:32645"))
      .addFeatureCollection("points", PointDataset({}, "EPSG:32645"));

  ASSERT_TRUE(catalog->imageCollection("S1").has_value());
  EXPECT_EQ(catalog->imageCollection("S1")->size(), 1u);
  EXPECT_TRUE(catalog->image("DEM").has_value());
  EXPECT_TRUE(catalog->featureCollection("points").has_value());

  EXPECT_FALSE(catalog->imageCollection("S2").has_value());
  EXPECT_THROW(catalog->requireImageCollection("S2"), ComputationError);
  EXPECT_THROW(catalog->requireImage("SRTM"), ComputationError);
  EXPECT_THROW(catalog->requireFeatureCollection("none"), ComputationError);
}

TEST(ManifestTest, LoadsScenesImagesAndPoints) {
  const auto dir = std::filesystem::temp_directory_path() / "ff_manifest";
  std::filesystem::create_directories(dir);

  Raster scene(40.0f, 40.0f, 10.0f, "EPSG:32645");
  scene.addBand(band::VV, -11.0f);
  scene.addBand(band::VH, -18.0f);
  ASSERT_TRUE(io::saveNpz((dir / "s1.npz").string(), scene));

  Raster dem(40.0f, 40.0f, 10.0f, "EPSG:32645");
  dem.addBand(band::elevation, 100.0f);
  ASSERT_TRUE(io::saveNpz((dir / "dem.npz").string(), dem));

  {
    std::ofstream fs(dir / "points.yaml");
    fs << "frame_id: EPSG:32645\n"
          "features:\n"
          "  - {id: a, x: 5.0, y: 5.0, properties: {Planet_flo: 1}}\n";
  }
  {
    std::ofstream fs(dir / "manifest.yaml");
    fs << "collections:\n"
          "  COPERNICUS/S1_GRD:\n"
          "    - id: s1_a\n"
          "      file: s1.npz\n"
          "      date: 2021-06-15\n"
          "      properties: {instrumentMode: IW}\n"
          "      list_properties: {transmitterReceiverPolarisation: [VV, VH]}\n"
          "images:\n"
          "  USGS/SRTMGL1_003: dem.npz\n"
          "feature_collections:\n"
          "  flood_points: points.yaml\n";
  }

  const auto catalog = loadCatalogManifest((dir / "manifest.yaml").string());
  const auto s1 = catalog->requireImageCollection("COPERNICUS/S1_GRD");
  ASSERT_EQ(s1.size(), 1u);
  EXPECT_EQ(s1.scenes()[0].date.toString(), "2021-06-15");
  EXPECT_EQ(s1.scenes()[0].properties.at("instrumentMode"), "IW");
  EXPECT_EQ(s1.scenes()[0].raster.bandCount(), 2u);
  EXPECT_FLOAT_EQ(
      s1.scenes()[0].raster.valueAt(band::VH, grid_map::Position(5.0, 5.0)),
      -18.0f);

  EXPECT_EQ(catalog->requireImage("USGS/SRTMGL1_003")
                .validPixelCount(band::elevation),
            16u);
  EXPECT_EQ(catalog->requireFeatureCollection("flood_points").size(), 1u);
}

TEST(ManifestTest, MissingFilesThrow) {
  EXPECT_THROW(loadCatalogManifest("/nonexistent/manifest.yaml"),
               std::runtime_error);

  const auto path = writeTempFile(
      "ff_bad_manifest.yaml",
      "images:\n  DEM: /nonexistent/dem.npz\n");
  EXPECT_THROW(loadCatalogManifest(path), std::runtime_error);
}
