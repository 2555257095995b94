// Copyright 2022 Eric Fichter
#include "Building.h"

namespace {

template<typename T>
double sum_area(const std::list<T> &L, double orientation) {
    double a = 0;
    for (const auto &e: L)
        if (e.orientation == orientation)
            a += e.area;
    return a;
}

template<typename T>
void distribute_area(std::list<T> &L, double orientation, double zone_share) {

    unsigned int n = 0;
    for (const auto &e: L)
        if (e.orientation == orientation)
            n++;

    for (auto &e: L)
        if (e.orientation == orientation)
            e.area = zone_share / n;
}

}

Building::Building(std::string _name, int _year_of_construction, int _number_of_floors, double _height_of_floors, double _net_leased_area, ConstructionData _construction_data) :
        name(std::move(_name)),
        year_of_construction(_year_of_construction),
        number_of_floors(_number_of_floors),
        height_of_floors(_height_of_floors),
        construction_data(_construction_data),
        net_leased_area(_net_leased_area) {

    inner_walls_approach = TEASER_DEFAULT;
    zone_id_counter = 0;
    zones.clear();
}

double Building::NetLeasedArea() const { return net_leased_area; }

void Building::SetNetLeasedArea(double value) { net_leased_area = value; }

void Building::AddNetLeasedArea(double value) { net_leased_area += value; }

Zone &Building::AddZone(const std::string &zone_name) {
    zones.emplace_back(zone_id_counter++, zone_name, this);
    return zones.back();
}

void Building::ClearZones() {
    zones.clear();
    zone_id_counter = 0;
    net_leased_area = 0;
}

std::list<Zone> &Building::Zones() { return zones; }

const std::list<Zone> &Building::Zones() const { return zones; }

void Building::SetOuterWallArea(double new_area, double orientation) {

    if (net_leased_area == 0)
        throw arithmetic_error("Building " + name + " has no net leased area to distribute outer wall area");

    for (auto &zone: zones) {
        const double zone_share = (new_area / net_leased_area) * zone.Area();
        distribute_area(zone.outer_walls, orientation, zone_share);
        distribute_area(zone.rooftops, orientation, zone_share);
        distribute_area(zone.ground_floors, orientation, zone_share);
        distribute_area(zone.doors, orientation, zone_share);
    }
}

void Building::SetWindowArea(double new_area, double orientation) {

    if (net_leased_area == 0)
        throw arithmetic_error("Building " + name + " has no net leased area to distribute window area");

    for (auto &zone: zones)
        distribute_area(zone.windows, orientation, (new_area / net_leased_area) * zone.Area());
}

double Building::OuterArea(double orientation) const {

    double a = 0;
    for (const auto &zone: zones) {
        a += sum_area(zone.outer_walls, orientation);
        a += sum_area(zone.rooftops, orientation);
        a += sum_area(zone.ground_floors, orientation);
        a += sum_area(zone.doors, orientation);
    }
    return a;
}

double Building::WindowArea(double orientation) const {

    double a = 0;
    for (const auto &zone: zones)
        a += sum_area(zone.windows, orientation);
    return a;
}

std::list<const BuildingElement *> Building::Elements() const {

    std::list<const BuildingElement *> L;
    for (const auto &zone: zones)
        for (const auto &e: zone.Elements())
            L.push_back(e);
    return L;
}

void Building::Log() const {

    std::cout << "Building " << name << "\n";
    std::cout << "\tYear of construction: " << year_of_construction << "\n";
    std::cout << "\tConstruction data:    " << construction_data.ToString() << "\n";
    std::cout << "\tFloors:               " << number_of_floors << " x " << height_of_floors << " m\n";
    std::cout << "\tNet leased area:      " << net_leased_area << " m2\n";
    std::cout << "\tZones:                " << zones.size() << "\n";

    std::cout << "\t\tname                    \t       type\t  tilt\torient\t      area\t n\t     d\t     R\tconstruction\n";
    for (const auto &zone: zones)
        zone.Log();
}
