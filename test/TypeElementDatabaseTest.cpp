// Copyright 2022 Eric Fichter
#include "test_helpers.h"

TEST_F(TestDataTest, ReadsRecordsInFileOrder) {

    EXPECT_EQ(data.Version(), "test");
    ASSERT_EQ(data.Records().size(), 7u);
    EXPECT_EQ(data.NumberOfMaterials(), 3u);

    EXPECT_EQ(data.Records().front().key, "OuterWall_narrow");
    EXPECT_EQ(data.Records().back().key, "Rooftop_missing_material");
}

TEST_F(TestDataTest, RecordFields) {

    const type_element_record &r = data.Find("OuterWall_narrow");

    EXPECT_EQ(r.age_min, 1900);
    EXPECT_EQ(r.age_max, 1950);
    EXPECT_EQ(r.construction_type, "iwu_heavy");
    EXPECT_DOUBLE_EQ(r.inner_convection, 2.7);
    EXPECT_DOUBLE_EQ(r.outer_convection, 20.0);
    EXPECT_TRUE(std::isnan(r.g_value));

    ASSERT_EQ(r.layers.size(), 2u);
    EXPECT_EQ(r.layers[0].id, "0");
    EXPECT_EQ(r.layers[0].material_id, "m_plaster");
    EXPECT_DOUBLE_EQ(r.layers[1].thickness, 0.3);
}

TEST_F(TestDataTest, AgeRangeIsAcceptedAsAgeGroup) {

    const type_element_record &r = data.Find("InnerWall_first");
    EXPECT_EQ(r.age_min, 1900);
    EXPECT_EQ(r.age_max, 1950);
    EXPECT_TRUE(r.Contains(1900));
    EXPECT_TRUE(r.Contains(1950));
    EXPECT_FALSE(r.Contains(1951));
}

TEST_F(TestDataTest, UnknownKeyIsNotFound) {

    EXPECT_FALSE(data.Contains("OuterWall_unknown"));
    EXPECT_THROW(data.Find("OuterWall_unknown"), not_found_error);
    EXPECT_THROW(data.FindMaterial("m_unknown"), not_found_error);
}

TEST_F(TestDataTest, MaterialDefaults) {

    const material_record &plaster = data.FindMaterial("m_plaster");
    EXPECT_DOUBLE_EQ(plaster.solar_absorp, 0.7);
    EXPECT_DOUBLE_EQ(plaster.ir_emissivity, 0.9);

    const material_record &brick = data.FindMaterial("m_brick");
    EXPECT_DOUBLE_EQ(brick.solar_absorp, 0.6);
    EXPECT_DOUBLE_EQ(brick.ir_emissivity, 0.85);
    EXPECT_DOUBLE_EQ(brick.thermal_conduc, 0.9);
}

TEST_F(TestDataTest, MatchingKeysInStorageOrder) {

    std::list<std::string> keys = data.MatchingKeys("OuterWall", 1920, "iwu_heavy");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys.front(), "OuterWall_narrow");
    EXPECT_EQ(keys.back(), "OuterWall_wide");

    EXPECT_EQ(data.MatchingKeys("OuterWall", 1975, "iwu_heavy").size(), 1u);
    EXPECT_TRUE(data.MatchingKeys("OuterWall", 1920, "iwu_light").empty());
    EXPECT_TRUE(data.MatchingKeys("OuterWall", 1850, "iwu_heavy").empty());
}

TEST_F(TestDataTest, NarrowestAgeGroupWins) {

    resolve_status status;

    const type_element_record *r = data.Select("OuterWall", 1920, "iwu_heavy", status);
    EXPECT_EQ(status, RESOLVED);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->key, "OuterWall_narrow");

    r = data.Select("OuterWall", 1975, "iwu_heavy", status);
    EXPECT_EQ(status, RESOLVED);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->key, "OuterWall_wide");
}

TEST_F(TestDataTest, EqualAgeGroupsAreAmbiguous) {

    resolve_status status;

    EXPECT_EQ(data.Select("InnerWall", 1945, "iwu_heavy", status), nullptr);
    EXPECT_EQ(status, AMBIGUOUS);

    EXPECT_NE(data.Select("InnerWall", 1960, "iwu_heavy", status), nullptr);
    EXPECT_EQ(status, RESOLVED);
}

TEST_F(TestDataTest, NoMatch) {

    resolve_status status;

    EXPECT_EQ(data.Select("OuterWall", 2010, "iwu_heavy", status), nullptr);
    EXPECT_EQ(status, NO_MATCH);

    EXPECT_EQ(data.Select("Door", 1920, "iwu_heavy", status), nullptr);
    EXPECT_EQ(status, NO_MATCH);
}

TEST_F(TestDataTest, FailedReadKeepsPreviousState) {

    std::istringstream type_elements(R"({"OuterWall_bad": {"building_age_group": [2000, 1900], "construction_type": "iwu_heavy"}})");
    std::istringstream materials(TEST_MATERIALS);

    EXPECT_THROW(data.Read(type_elements, materials), configuration_error);
    EXPECT_EQ(data.Records().size(), 7u);
    EXPECT_TRUE(data.Contains("OuterWall_narrow"));
}

TEST(TypeElementDatabaseTest, DuplicateKeyIsRejected) {

    TypeElementDatabase data;
    std::istringstream type_elements(R"({
        "OuterWall_a": {"building_age_group": [1900, 2000], "construction_type": "iwu_heavy"},
        "OuterWall_a": {"building_age_group": [1900, 2000], "construction_type": "iwu_light"}
    })");
    std::istringstream materials(TEST_MATERIALS);

    EXPECT_THROW(data.Read(type_elements, materials), configuration_error);
    EXPECT_TRUE(data.Records().empty());
}

TEST(TypeElementDatabaseTest, InvalidRecordsAreRejected) {

    TypeElementDatabase data;

    const std::list<std::string> invalid = {
            R"({"OuterWall_a": {"construction_type": "iwu_heavy"}})",
            R"({"OuterWall_a": {"building_age_group": [1900], "construction_type": "iwu_heavy"}})",
            R"({"OuterWall_a": {"building_age_group": [1900, 2000], "construction_type": "iwu_heavy",
                "layer": {"0": {"thickness": 0.0, "material": {"name": "brick", "material_id": "m_brick"}}}}})"};

    for (const auto &json: invalid) {
        std::istringstream type_elements(json);
        std::istringstream materials(TEST_MATERIALS);
        EXPECT_THROW(data.Read(type_elements, materials), configuration_error) << json;
    }
}

TEST(TypeElementDatabaseTest, LoadFromFiles) {

    TypeElementDatabase data;

    std::string te = write_temp_file(TEST_TYPE_ELEMENTS);
    std::string mat = write_temp_file(TEST_MATERIALS);

    EXPECT_TRUE(data.Load(te, mat));
    EXPECT_EQ(data.Records().size(), 7u);

    EXPECT_FALSE(data.Load(te, "does/not/exist.json"));

    std::string broken = write_temp_file("{ not json");
    EXPECT_FALSE(data.Load(broken, mat));
    EXPECT_EQ(data.Records().size(), 7u);

    boost::filesystem::remove(te);
    boost::filesystem::remove(mat);
    boost::filesystem::remove(broken);
}

TEST_F(ShippedDataTest, ShippedDatabaseIsConsistent) {

    EXPECT_GT(data.Records().size(), 0u);

    // every layer references a known material
    for (const auto &r: data.Records())
        for (const auto &l: r.layers)
            EXPECT_NO_THROW(data.FindMaterial(l.material_id)) << r.key;

    EXPECT_NO_THROW(use_conditions.Find("Living"));
}
