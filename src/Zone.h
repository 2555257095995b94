// Copyright 2022 Eric Fichter
#ifndef ZONE_H
#define ZONE_H

#include "headers.h"
#include "BuildingElement.h"
#include "UseConditions.h"

class Building;

//! Thermal zone of a building. Owns its building elements.
class Zone {

public:
    Zone(unsigned int _id, std::string _name, Building *_parent);

    bool operator==(const Zone &Z) const { return id == Z.id; }

    unsigned int id;
    std::string name;

    //! Returns net leased area of the zone.
    double Area() const;

    //! Sets area. The difference is added to the net leased area of the parent building.
    void SetArea(double value);

    //! Returns own number of floors or the one of the building, if not overridden.
    int NumberOfFloors() const;

    //! Returns own height of floors or the one of the building, if not overridden.
    double HeightOfFloors() const;

    //! Overrides number of floors of the building.
    void SetNumberOfFloors(int n);

    //! Overrides height of floors of the building.
    void SetHeightOfFloors(double h);

    //! Returns volume calculated by SetVolume.
    double Volume() const;

    //! Calculates volume by area and height of floors.
    void SetVolume();

    //! Calculates areas of inner walls, ceilings and floors by typical room dimensions of the usage.
    //! Outer walls must have their final areas for TYPICAL_MINUS_OUTER.
    void SetInnerWallArea(inner_wall_approach approach);

    //! Returns use condition.
    const use_condition &UseCondition() const;

    //! Sets use condition.
    void SetUseCondition(const use_condition &u);

    //! Returns sum of areas of outer walls.
    double OuterWallArea() const;

    //! Returns all elements of the zone.
    std::list<BuildingElement *> Elements();

    //! Returns all elements of the zone.
    std::list<const BuildingElement *> Elements() const;

    //! Print attributes.
    void Log() const;

    std::list<OuterWall> outer_walls;
    std::list<Window> windows;
    std::list<Door> doors;
    std::list<Rooftop> rooftops;
    std::list<GroundFloor> ground_floors;
    std::list<InnerWall> inner_walls;
    std::list<Ceiling> ceilings;
    std::list<Floor> floors;

private:
    Building *parent;
    double area;
    int number_of_floors; // 0: inherited from building
    double height_of_floors; // 0: inherited from building
    double volume;
    use_condition usage;
};

#endif //ZONE_H
