// Copyright 2022 Eric Fichter
#ifndef BUILDING_H
#define BUILDING_H

#include "headers.h"
#include "ConstructionData.h"
#include "Zone.h"

//! Building with thermal zones. Zones keep a pointer to their building, so buildings are not copyable.
class Building {

public:
    Building(std::string _name, int _year_of_construction, int _number_of_floors, double _height_of_floors, double _net_leased_area, ConstructionData _construction_data);

    Building(const Building &) = delete;

    Building &operator=(const Building &) = delete;

    virtual ~Building() = default;

    std::string name;
    int year_of_construction;
    int number_of_floors;
    double height_of_floors;
    ConstructionData construction_data;
    inner_wall_approach inner_walls_approach;

    //! Returns net leased area, i.e. the sum of zone areas once zones exist.
    double NetLeasedArea() const;

    //! Sets net leased area.
    void SetNetLeasedArea(double value);

    //! Adds to the net leased area. Used by zones when their area changes.
    void AddNetLeasedArea(double value);

    //! Creates a new zone.
    Zone &AddZone(const std::string &zone_name);

    //! Removes all zones and resets net leased area to 0.
    void ClearZones();

    std::list<Zone> &Zones();

    const std::list<Zone> &Zones() const;

    //! Distributes area on outer walls, rooftops, ground floors and doors with orientation proportionally to zone areas.
    //! Throws arithmetic_error if net leased area is 0.
    void SetOuterWallArea(double new_area, double orientation);

    //! Distributes area on windows with orientation proportionally to zone areas.
    //! Throws arithmetic_error if net leased area is 0.
    void SetWindowArea(double new_area, double orientation);

    //! Returns sum of areas of opaque outer elements with orientation.
    double OuterArea(double orientation) const;

    //! Returns sum of areas of windows with orientation.
    double WindowArea(double orientation) const;

    //! Returns all elements of all zones.
    std::list<const BuildingElement *> Elements() const;

    //! Print attributes.
    virtual void Log() const;

private:
    double net_leased_area;
    std::list<Zone> zones;
    unsigned int zone_id_counter;
};

#endif //BUILDING_H
