// Copyright 2022 Eric Fichter
#include "test_helpers.h"
#include "EstimationTables.h"

TEST(EstimationTablesTest, EveryConfigurationHasCoefficients) {

    const EstimationTables &T = EstimationTables::Instance();

    for (int i = 0; i <= 3; i++) {
        EXPECT_NO_THROW(T.HeatedCellar(i));
        EXPECT_NO_THROW(T.Attic(i));
    }
    for (int i = 0; i <= 2; i++)
        EXPECT_NO_THROW(T.Neighbours(i));
    for (int i = 0; i <= 1; i++) {
        EXPECT_NO_THROW(T.FacadeToFloorArea(i));
        EXPECT_NO_THROW(T.Dormer(i));
    }
}

TEST(EstimationTablesTest, OutOfDomainIsConfigurationError) {

    const EstimationTables &T = EstimationTables::Instance();

    EXPECT_THROW(T.HeatedCellar(-1), configuration_error);
    EXPECT_THROW(T.HeatedCellar(4), configuration_error);
    EXPECT_THROW(T.Attic(4), configuration_error);
    EXPECT_THROW(T.Neighbours(3), configuration_error);
    EXPECT_THROW(T.FacadeToFloorArea(2), configuration_error);
    EXPECT_THROW(T.Dormer(2), configuration_error);
}

TEST(EstimationTablesTest, Coefficients) {

    const EstimationTables &T = EstimationTables::Instance();

    EXPECT_DOUBLE_EQ(T.HeatedCellar(2), 0.5);
    EXPECT_DOUBLE_EQ(T.HeatedCellar(3), 1.0);

    EXPECT_DOUBLE_EQ(T.Attic(0).area_per_floor, 1.33);
    EXPECT_DOUBLE_EQ(T.Attic(1).area_per_roof, 1.33);
    EXPECT_DOUBLE_EQ(T.Attic(2).heated_attic, 0.5);
    EXPECT_DOUBLE_EQ(T.Attic(3).area_per_floor, 1.5);

    EXPECT_DOUBLE_EQ(T.Neighbours(0).extra_floor_area, 50.0);
    EXPECT_DOUBLE_EQ(T.Neighbours(2).extra_floor_area, 10.0);

    EXPECT_DOUBLE_EQ(T.FacadeToFloorArea(0), 0.66);
    EXPECT_DOUBLE_EQ(T.FacadeToFloorArea(1), 0.8);
    EXPECT_DOUBLE_EQ(T.Dormer(1), 1.3);
}
