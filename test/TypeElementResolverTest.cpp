// Copyright 2022 Eric Fichter
#include "test_helpers.h"
#include "TypeElementResolver.h"

TEST_F(TestDataTest, ResolvesCoefficientsAndLayers) {

    OuterWall wall;
    EXPECT_FALSE(wall.HasTypeData());

    EXPECT_EQ(TypeElementResolver::load_type_element(wall, 1920, "iwu_heavy", data), RESOLVED);

    EXPECT_TRUE(wall.HasTypeData());
    EXPECT_EQ(wall.type_element_key, "OuterWall_narrow");
    EXPECT_EQ(wall.building_age_min, 1900);
    EXPECT_EQ(wall.building_age_max, 1950);
    EXPECT_EQ(wall.construction_type, "iwu_heavy");
    EXPECT_DOUBLE_EQ(wall.inner_radiation, 5.0);
    EXPECT_DOUBLE_EQ(wall.inner_convection, 2.7);
    EXPECT_DOUBLE_EQ(wall.outer_radiation, 5.0);
    EXPECT_DOUBLE_EQ(wall.outer_convection, 20.0);

    ASSERT_EQ(wall.Layers().size(), 2u);
    const Layer &first = wall.Layers().front();
    const Layer &last = wall.Layers().back();
    EXPECT_EQ(first.ID(), "0");
    EXPECT_EQ(first.Position(), 0u);
    EXPECT_EQ(first.RelMaterial().id, "m_plaster");
    EXPECT_EQ(first.RelMaterial().name, "plaster");
    EXPECT_DOUBLE_EQ(first.RelMaterial().density, 1600.0);
    EXPECT_EQ(last.ID(), "1");
    EXPECT_EQ(last.Position(), 1u);
    EXPECT_EQ(last.RelMaterial().id, "m_brick");

    EXPECT_NEAR(wall.TotalThickness(), 0.32, 1e-12);
    EXPECT_NEAR(wall.ConductiveResistance(), 0.02 / 0.7 + 0.3 / 0.9, 1e-12);
}

TEST_F(TestDataTest, ReversedLayers) {

    OuterWall wall;
    ASSERT_EQ(TypeElementResolver::load_type_element(wall, 1920, "iwu_heavy", data, "", true), RESOLVED);

    ASSERT_EQ(wall.Layers().size(), 2u);
    const Layer &first = wall.Layers().front();
    const Layer &last = wall.Layers().back();
    EXPECT_EQ(first.ID(), "1");
    EXPECT_EQ(first.Position(), 0u);
    EXPECT_EQ(first.RelMaterial().id, "m_brick");
    EXPECT_EQ(last.ID(), "0");
    EXPECT_EQ(last.Position(), 1u);
    EXPECT_EQ(last.RelMaterial().id, "m_plaster");
}

TEST_F(TestDataTest, NoMatchLeavesElementUntouched) {

    OuterWall wall;
    wall.name = "north";
    wall.area = 12.5;

    EXPECT_EQ(TypeElementResolver::load_type_element(wall, 2010, "iwu_heavy", data), NO_MATCH);

    EXPECT_FALSE(wall.HasTypeData());
    EXPECT_TRUE(std::isnan(wall.inner_convection));
    EXPECT_TRUE(std::isnan(wall.outer_convection));
    EXPECT_TRUE(wall.type_element_key.empty());
    EXPECT_TRUE(wall.Layers().empty());
    EXPECT_EQ(wall.name, "north");
    EXPECT_DOUBLE_EQ(wall.area, 12.5);
}

TEST_F(TestDataTest, AmbiguousLeavesElementUntouched) {

    InnerWall wall;
    EXPECT_EQ(TypeElementResolver::load_type_element(wall, 1945, "iwu_heavy", data), AMBIGUOUS);
    EXPECT_FALSE(wall.HasTypeData());
    EXPECT_TRUE(wall.Layers().empty());
}

TEST_F(TestDataTest, CategoryOverride) {

    Ceiling ceiling;
    EXPECT_EQ(TypeElementResolver::load_type_element(ceiling, 1960, "iwu_heavy", data), NO_MATCH);

    EXPECT_EQ(TypeElementResolver::load_type_element(ceiling, 1960, "iwu_heavy", data, "InnerWall"), RESOLVED);
    EXPECT_EQ(ceiling.type_element_key, "InnerWall_second");
    EXPECT_EQ(ceiling.Layers().size(), 1u);
}

TEST_F(TestDataTest, WindowCoefficients) {

    Window window;
    ASSERT_EQ(TypeElementResolver::load_type_element(window, 1980, "Kunststofffenster, Isolierverglasung", data), RESOLVED);

    EXPECT_DOUBLE_EQ(window.g_value, 0.75);
    EXPECT_DOUBLE_EQ(window.a_conv, 0.03);
    EXPECT_DOUBLE_EQ(window.shading_g_total, 0.25);
    EXPECT_DOUBLE_EQ(window.shading_max_irr, 100.0);
    EXPECT_DOUBLE_EQ(window.outer_convection, 20.0);
}

TEST_F(TestDataTest, ReloadingReplacesLayers) {

    OuterWall wall;
    ASSERT_EQ(TypeElementResolver::load_type_element(wall, 1920, "iwu_heavy", data), RESOLVED);
    ASSERT_EQ(TypeElementResolver::load_type_element(wall, 1920, "iwu_heavy", data), RESOLVED);
    EXPECT_EQ(wall.Layers().size(), 2u);

    TypeElementResolver::load_type_element_by_key(wall, "OuterWall_wide", data);
    EXPECT_EQ(wall.type_element_key, "OuterWall_wide");
    ASSERT_EQ(wall.Layers().size(), 1u);
    EXPECT_DOUBLE_EQ(wall.TotalThickness(), 0.4);
    EXPECT_DOUBLE_EQ(wall.outer_convection, 25.0);
}

TEST_F(TestDataTest, LoadByUnknownKeyThrows) {

    OuterWall wall;
    EXPECT_THROW(TypeElementResolver::load_type_element_by_key(wall, "OuterWall_unknown", data), not_found_error);
    EXPECT_FALSE(wall.HasTypeData());
}

TEST_F(TestDataTest, MissingMaterialKeepsElement) {

    Rooftop roof;
    ASSERT_EQ(TypeElementResolver::load_type_element(roof, 1920, "iwu_heavy", data, "OuterWall"), RESOLVED);

    EXPECT_THROW(TypeElementResolver::load_type_element_by_key(roof, "Rooftop_missing_material", data), not_found_error);
    EXPECT_EQ(roof.type_element_key, "OuterWall_narrow");
    EXPECT_EQ(roof.Layers().size(), 2u);
}

TEST_F(TestDataTest, MissingCoefficientKeepsElement) {

    GroundFloor ground;
    EXPECT_THROW(TypeElementResolver::load_type_element_by_key(ground, "GroundFloor_incomplete", data), not_found_error);
    EXPECT_FALSE(ground.HasTypeData());
    EXPECT_TRUE(ground.type_element_key.empty());
    EXPECT_TRUE(ground.Layers().empty());
}

TEST_F(TestDataTest, LoadMaterialById) {

    Material m;
    TypeElementResolver::load_material_id(m, "m_brick", data);
    EXPECT_EQ(m.name, "brick");
    EXPECT_DOUBLE_EQ(m.thermal_conduc, 0.9);
    EXPECT_DOUBLE_EQ(m.solar_absorp, 0.6);

    EXPECT_THROW(TypeElementResolver::load_material_id(m, "m_unknown", data), not_found_error);
}

TEST(BuildingElementTest, CategoryNames) {

    EXPECT_EQ(OuterWall().TypeName(), "OuterWall");
    EXPECT_EQ(InnerWall().TypeName(), "InnerWall");
    EXPECT_EQ(Window().TypeName(), "Window");
    EXPECT_EQ(Rooftop().TypeName(), "Rooftop");
    EXPECT_EQ(GroundFloor().TypeName(), "GroundFloor");
    EXPECT_EQ(Ceiling().TypeName(), "Ceiling");
    EXPECT_EQ(Floor().TypeName(), "Floor");
    EXPECT_EQ(Door().TypeName(), "Door");
}

TEST(BuildingElementTest, LayerWithoutConductivityHasNoResistance) {

    InnerWall wall;
    Layer &layer = wall.AddLayer("0", 0.1);
    layer.RelMaterial().thermal_conduc = 0;
    wall.AddLayer("1", 0.2).RelMaterial().thermal_conduc = 0.5;

    EXPECT_DOUBLE_EQ(wall.ConductiveResistance(), 0.4);
    EXPECT_NEAR(wall.TotalThickness(), 0.3, 1e-12);
}

TEST_F(ShippedDataTest, KeyLoadIsFoundAgainByCharacteristics) {

    for (const auto &r: data.Records()) {
        if (!boost::algorithm::starts_with(r.key, "OuterWall"))
            continue;

        OuterWall wall;
        TypeElementResolver::load_type_element_by_key(wall, r.key, data);

        std::list<std::string> keys = data.MatchingKeys(wall.TypeName(), wall.building_age_min, wall.construction_type);
        EXPECT_NE(std::find(keys.begin(), keys.end(), r.key), keys.end()) << r.key;

        OuterWall resolved;
        EXPECT_EQ(TypeElementResolver::load_type_element(resolved, wall.building_age_max, wall.construction_type, data), RESOLVED);
        EXPECT_EQ(resolved.type_element_key, r.key);
    }
}
