// Copyright 2022 Eric Fichter
#ifndef SINGLEFAMILYDWELLING_H
#define SINGLEFAMILYDWELLING_H

#include "headers.h"
#include "Building.h"
#include "EstimationTables.h"
#include "TypeElementDatabase.h"
#include "TypeElementResolver.h"
#include "UseConditions.h"

//! Intermediate values of the envelope estimation.
struct envelope_estimate {
    double heated_floors;
    double living_area_per_floor;
    double ground_floor_area;
    double roof_area;
    double top_floor_area;
    double facade_area;
    double window_area;
    double cellar_wall_area;
    double outer_wall_area;
};

//! Residential archetype according to the IWU short method.
//! A single zone building with four outer walls, four windows, one roof and one ground floor.
//! Net leased area, number of floors and five categorical values (layout, neighbours, attic, cellar, dormer)
//! are turned into envelope areas. Constructions are loaded from the type element database
//! by year of construction and construction data.
//! Categorical values only change areas, not the number, tilt or orientation of elements.
class SingleFamilyDwelling : public Building {

public:
    //! _residential_layout: 0 compact, 1 elongated/complex.
    //! _neighbour_buildings: 0, 1 or 2 neighbours.
    //! _attic: 0 flat roof, 1 non heated, 2 partly heated, 3 heated attic.
    //! _cellar: 0 no cellar, 1 non heated, 2 partly heated, 3 heated cellar.
    //! _dormer: 0 no dormer, 1 dormer.
    SingleFamilyDwelling(std::string _name,
                         int _year_of_construction,
                         int _number_of_floors,
                         double _height_of_floors,
                         double _net_leased_area,
                         ConstructionData _construction_data,
                         int _residential_layout = 0,
                         int _neighbour_buildings = 0,
                         int _attic = 0,
                         int _cellar = 0,
                         int _dormer = 0);

    int residential_layout;
    int neighbour_buildings;
    int attic;
    int cellar;
    int dormer;

    //! If true, an element without (unique) type element aborts the generation. Else a warning is printed.
    bool strict;

    // Estimation factors (expert mode)
    double est_living_area_factor; // f_W
    double est_bottom_building_closure; // p_FB
    double est_upper_building_closure;
    double est_factor_win_area;
    double est_factor_cellar_area;

    //! Zones as fraction of net leased area with usage and optional overrides.
    std::list<zone_definition> zone_area_factors;

    // Element instances per zone
    std::list<element_placement> outer_wall_names;
    std::list<element_placement> window_names;
    std::list<element_placement> roof_names;
    std::list<element_placement> ground_floor_names;
    std::list<element_placement> inner_wall_names;
    std::list<element_placement> ceiling_names;
    std::list<element_placement> floor_names;

    //! Generates zones and elements. Returns false on error. The building must be discarded in that case.
    bool GenerateArchetype(const TypeElementDatabase &data, const UseConditions &use_conditions);

    //! Estimates envelope areas of a building with net leased area.
    //! Throws configuration_error for categorical values without coefficients
    //! and arithmetic_error if the number of heated floors is 0.
    envelope_estimate Estimate(double type_bldg_area) const;

    //! Returns estimation of the last generation.
    const envelope_estimate &Estimates() const;

    void Log() const override;

private:
    envelope_estimate estimate;

    void create_zones(double type_bldg_area, const UseConditions &use_conditions);

    void create_envelope(const TypeElementDatabase &data);

    void commit_areas();

    template<typename T>
    void create_elements(std::list<T> Zone::*elements, const std::list<element_placement> &placements, const std::string &construction, const TypeElementDatabase &data);

    void check_status(resolve_status status, const BuildingElement &element, const std::string &construction) const;
};

#endif //SINGLEFAMILYDWELLING_H
