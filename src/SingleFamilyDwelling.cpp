// Copyright 2022 Eric Fichter
#include "SingleFamilyDwelling.h"

SingleFamilyDwelling::SingleFamilyDwelling(std::string _name,
                                           int _year_of_construction,
                                           int _number_of_floors,
                                           double _height_of_floors,
                                           double _net_leased_area,
                                           ConstructionData _construction_data,
                                           int _residential_layout,
                                           int _neighbour_buildings,
                                           int _attic,
                                           int _cellar,
                                           int _dormer) :
        Building(std::move(_name), _year_of_construction, _number_of_floors, _height_of_floors, _net_leased_area, _construction_data),
        residential_layout(_residential_layout),
        neighbour_buildings(_neighbour_buildings),
        attic(_attic),
        cellar(_cellar),
        dormer(_dormer) {

    strict = true;

    est_living_area_factor = 0.75;
    est_bottom_building_closure = 1.33;
    est_upper_building_closure = 1.0;
    est_factor_win_area = 0.2;
    est_factor_cellar_area = 0.5;

    estimate = envelope_estimate();

    zone_area_factors = {zone_definition("SingleDwelling", 1.0, "Living")};

    // building in north-south orientation
    outer_wall_names = {element_placement("Exterior Facade North", 90.0, 0.0),
                        element_placement("Exterior Facade East", 90.0, 90.0),
                        element_placement("Exterior Facade South", 90.0, 180.0),
                        element_placement("Exterior Facade West", 90.0, 270.0)};

    window_names = {element_placement("Window Facade North", 90.0, 0.0),
                    element_placement("Window Facade East", 90.0, 90.0),
                    element_placement("Window Facade South", 90.0, 180.0),
                    element_placement("Window Facade West", 90.0, 270.0)};

    roof_names = {element_placement("Rooftop", 0.0, ORIENTATION_UP)};
    ground_floor_names = {element_placement("Ground Floor", 0.0, ORIENTATION_DOWN)};
    inner_wall_names = {element_placement("InnerWall", 90.0, 0.0)};
    ceiling_names = {element_placement("Ceiling", 0.0, ORIENTATION_UP)};
    floor_names = {element_placement("Floor", 0.0, ORIENTATION_DOWN)};
}

bool SingleFamilyDwelling::GenerateArchetype(const TypeElementDatabase &data, const UseConditions &use_conditions) {

    // The net leased area is derived again from the zone areas
    const double type_bldg_area = NetLeasedArea();

    try {
        ClearZones();

        estimate = Estimate(type_bldg_area);

        if (estimate.outer_wall_area < 0)
            std::cerr << "[Warning] " << name << ": Estimated outer wall area is negative (" << estimate.outer_wall_area << " m2)." << std::endl;

        create_zones(type_bldg_area, use_conditions);
        create_envelope(data);
        commit_areas();
    }
    catch (const std::exception &e) {
        std::cerr << "[Error] " << name << ": " << e.what() << std::endl;
        ClearZones();
        SetNetLeasedArea(type_bldg_area);
        return false;
    }

    return true;
}

envelope_estimate SingleFamilyDwelling::Estimate(double type_bldg_area) const {

    const EstimationTables &T = EstimationTables::Instance();

    // all lookups first, invalid configurations are reported before any arithmetic
    const double f_heated_cellar = T.HeatedCellar(cellar);
    const attic_coefficients &A = T.Attic(attic);
    const neighbour_coefficients &N = T.Neighbours(neighbour_buildings);
    const double p_facade = T.FacadeToFloorArea(residential_layout);
    const double f_dormer = T.Dormer(dormer);

    envelope_estimate E;

    E.heated_floors = f_heated_cellar + number_of_floors + est_living_area_factor * A.heated_attic;

    if (E.heated_floors <= 0)
        throw arithmetic_error("Division by zero: effective number of heated floors is " + std::to_string(E.heated_floors) + " (number_of_floors = " + std::to_string(number_of_floors) + ", cellar = " + std::to_string(cellar) + ", attic = " + std::to_string(attic) + ")");

    E.living_area_per_floor = type_bldg_area / E.heated_floors;

    E.ground_floor_area = est_bottom_building_closure * E.living_area_per_floor;

    E.roof_area = est_upper_building_closure * f_dormer * A.area_per_floor * E.living_area_per_floor;

    // flat roofs have no roof term but the top floor still needs an upper surface
    E.top_floor_area = A.area_per_roof * E.living_area_per_floor;
    if (E.roof_area == 0)
        E.roof_area = E.top_floor_area;

    E.facade_area = p_facade * (E.living_area_per_floor + N.extra_floor_area);

    E.window_area = est_factor_win_area * type_bldg_area;

    E.cellar_wall_area = est_factor_cellar_area * f_heated_cellar * E.facade_area;

    E.outer_wall_area = E.heated_floors * E.facade_area - E.cellar_wall_area - E.window_area;

    return E;
}

const envelope_estimate &SingleFamilyDwelling::Estimates() const { return estimate; }

void SingleFamilyDwelling::create_zones(double type_bldg_area, const UseConditions &use_conditions) {

    for (const auto &z: zone_area_factors) {
        Zone &zone = AddZone(z.name);
        zone.SetArea(type_bldg_area * z.area_fraction);
        if (z.number_of_floors > 0)
            zone.SetNumberOfFloors(z.number_of_floors);
        if (z.height_of_floors > 0)
            zone.SetHeightOfFloors(z.height_of_floors);
        zone.SetUseCondition(use_conditions.Find(z.usage));
    }
}

template<typename T>
void SingleFamilyDwelling::create_elements(std::list<T> Zone::*elements, const std::list<element_placement> &placements, const std::string &construction, const TypeElementDatabase &data) {

    for (const auto &p: placements)
        for (auto &zone: Zones()) {
            (zone.*elements).emplace_back();
            T &element = (zone.*elements).back();
            element.name = p.name;
            resolve_status status = TypeElementResolver::load_type_element(element, year_of_construction, construction, data);
            check_status(status, element, construction);
            element.tilt = p.tilt;
            element.orientation = p.orientation;
        }
}

void SingleFamilyDwelling::create_envelope(const TypeElementDatabase &data) {

    const std::string construction = construction_data.ToString();

    create_elements(&Zone::outer_walls, outer_wall_names, construction, data);
    create_elements(&Zone::windows, window_names, construction_data.WindowConstruction(), data);
    create_elements(&Zone::rooftops, roof_names, construction, data);
    create_elements(&Zone::ground_floors, ground_floor_names, construction, data);
    create_elements(&Zone::inner_walls, inner_wall_names, construction, data);

    if (number_of_floors > 1) {
        create_elements(&Zone::ceilings, ceiling_names, construction, data);
        create_elements(&Zone::floors, floor_names, construction, data);
    }
}

void SingleFamilyDwelling::commit_areas() {

    if (outer_wall_names.empty())
        throw configuration_error("No outer walls defined to distribute the facade area");

    const double nr_of_orientation = outer_wall_names.size();

    std::map<double, double> outer_area;
    std::map<double, double> window_area;

    for (const auto &p: outer_wall_names)
        outer_area[p.orientation] = estimate.outer_wall_area / nr_of_orientation;
    for (const auto &p: window_names)
        window_area[p.orientation] = estimate.window_area / nr_of_orientation;
    for (const auto &p: roof_names)
        outer_area[p.orientation] = estimate.roof_area;
    for (const auto &p: ground_floor_names)
        outer_area[p.orientation] = estimate.ground_floor_area;

    for (const auto &a: outer_area)
        SetOuterWallArea(a.second, a.first);
    for (const auto &a: window_area)
        SetWindowArea(a.second, a.first);

    for (auto &zone: Zones()) {
        zone.SetInnerWallArea(inner_walls_approach);
        zone.SetVolume();
    }
}

void SingleFamilyDwelling::check_status(resolve_status status, const BuildingElement &element, const std::string &construction) const {

    if (status == RESOLVED)
        return;

    std::string msg = element.Info() + ": " + TypeElementResolver::status_to_string(status) + " for year " + std::to_string(year_of_construction) + " and construction '" + construction + "'";

    if (strict)
        throw configuration_error(msg);

    std::cerr << "[Warning] " << name << ": " << msg << std::endl;
}

void SingleFamilyDwelling::Log() const {

    std::cout << "\n";
    Building::Log();

    std::cout << "\tEstimation (layout " << residential_layout << ", neighbours " << neighbour_buildings << ", attic " << attic << ", cellar " << cellar << ", dormer " << dormer << ")\n";
    std::cout << "\t\tHeated floors:         " << estimate.heated_floors << "\n";
    std::cout << "\t\tLiving area per floor: " << estimate.living_area_per_floor << " m2\n";
    std::cout << "\t\tGround floor area:     " << estimate.ground_floor_area << " m2\n";
    std::cout << "\t\tRoof area:             " << estimate.roof_area << " m2\n";
    std::cout << "\t\tFacade area:           " << estimate.facade_area << " m2\n";
    std::cout << "\t\tWindow area:           " << estimate.window_area << " m2\n";
    std::cout << "\t\tCellar wall area:      " << estimate.cellar_wall_area << " m2\n";
    std::cout << "\t\tOuter wall area:       " << estimate.outer_wall_area << " m2\n";
}
