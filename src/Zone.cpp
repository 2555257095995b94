// Copyright 2022 Eric Fichter
#include "Zone.h"
#include "Building.h"

Zone::Zone(unsigned int _id, std::string _name, Building *_parent) : id(_id), name(std::move(_name)), parent(_parent) {
    area = 0;
    number_of_floors = 0;
    height_of_floors = 0;
    volume = 0;
    usage.typical_length = 0;
    usage.typical_width = 0;
}

double Zone::Area() const { return area; }

void Zone::SetArea(double value) {
    if (parent != nullptr)
        parent->AddNetLeasedArea(value - area);
    area = value;
}

int Zone::NumberOfFloors() const {
    if (number_of_floors > 0 || parent == nullptr) return number_of_floors;
    return parent->number_of_floors;
}

double Zone::HeightOfFloors() const {
    if (height_of_floors > 0 || parent == nullptr) return height_of_floors;
    return parent->height_of_floors;
}

void Zone::SetNumberOfFloors(int n) { number_of_floors = n; }

void Zone::SetHeightOfFloors(double h) { height_of_floors = h; }

double Zone::Volume() const { return volume; }

void Zone::SetVolume() { volume = area * HeightOfFloors(); }

void Zone::SetInnerWallArea(inner_wall_approach approach) {

    const int n = NumberOfFloors();
    const double h = HeightOfFloors();
    const double L = usage.typical_length;
    const double W = usage.typical_width;

    if (L <= 0 || W <= 0)
        throw configuration_error("Zone " + name + " has no use condition with typical room dimensions");
    if (n <= 0)
        throw arithmetic_error("Zone " + name + " has no floors");

    // horizontal inner elements exist between floors only
    const double horizontal = ((n - 1) / (double) n) * area;
    for (auto &ceiling: ceilings)
        ceiling.area = horizontal / ceilings.size();
    for (auto &floor: floors)
        floor.area = horizontal / floors.size();

    if (inner_walls.empty())
        return;

    const double avg_room_nr = area / (L * W);
    double a;

    if (approach == TEASER_DEFAULT)
        a = avg_room_nr * (L * h + 2 * W * h);
    else {
        a = avg_room_nr * (2 * L * h + 2 * W * h) - OuterWallArea();
        if (a < 0) {
            std::cerr << "[Warning] Outer walls of zone " << name << " exceed typical inner wall area. Inner wall area is set to 0." << std::endl;
            a = 0;
        }
    }

    for (auto &wall: inner_walls)
        wall.area = a / inner_walls.size();
}

const use_condition &Zone::UseCondition() const { return usage; }

void Zone::SetUseCondition(const use_condition &u) { usage = u; }

double Zone::OuterWallArea() const {

    double a = 0;
    for (const auto &wall: outer_walls)
        a += wall.area;
    return a;
}

std::list<BuildingElement *> Zone::Elements() {

    std::list<BuildingElement *> L;
    for (auto &e: outer_walls) L.push_back(&e);
    for (auto &e: windows) L.push_back(&e);
    for (auto &e: doors) L.push_back(&e);
    for (auto &e: rooftops) L.push_back(&e);
    for (auto &e: ground_floors) L.push_back(&e);
    for (auto &e: inner_walls) L.push_back(&e);
    for (auto &e: ceilings) L.push_back(&e);
    for (auto &e: floors) L.push_back(&e);
    return L;
}

std::list<const BuildingElement *> Zone::Elements() const {

    std::list<const BuildingElement *> L;
    for (auto &e: outer_walls) L.push_back(&e);
    for (auto &e: windows) L.push_back(&e);
    for (auto &e: doors) L.push_back(&e);
    for (auto &e: rooftops) L.push_back(&e);
    for (auto &e: ground_floors) L.push_back(&e);
    for (auto &e: inner_walls) L.push_back(&e);
    for (auto &e: ceilings) L.push_back(&e);
    for (auto &e: floors) L.push_back(&e);
    return L;
}

void Zone::Log() const {

    std::cout << "\tZone " << id << " " << name << " (" << usage.usage << ")";
    std::cout << "\tarea " << area << " m2";
    std::cout << "\tvolume " << volume << " m3";
    std::cout << "\tfloors " << NumberOfFloors() << " x " << HeightOfFloors() << " m\n";

    for (const auto &e: Elements())
        e->Log();
}
