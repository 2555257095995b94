// Copyright 2022 Eric Fichter
#ifndef PROJECT_H
#define PROJECT_H

#include "headers.h"
#include "SingleFamilyDwelling.h"
#include "TypeElementDatabase.h"
#include "UseConditions.h"

//! Collection of archetype buildings sharing one type element database and one set of use conditions.
//! The data is only read while buildings are generated, so buildings are generated in parallel.
class Project {

public:
    Project(std::string _name = "Project");

    std::string name;

    //! Reads database and use conditions. Returns false on any error.
    bool LoadData(const std::string &type_elements_path, const std::string &materials_path, const std::string &use_conditions_path);

    TypeElementDatabase &Data();

    UseConditions &Usages();

    //! Registers a single family dwelling. It is generated by GenerateAll.
    SingleFamilyDwelling &AddResidential(const std::string &building_name,
                                         int year_of_construction,
                                         int number_of_floors,
                                         double height_of_floors,
                                         double net_leased_area,
                                         ConstructionData construction_data,
                                         int residential_layout = 0,
                                         int neighbour_buildings = 0,
                                         int attic = 0,
                                         int cellar = 0,
                                         int dormer = 0);

    //! Generates all buildings with num_threads threads. Buildings that fail are removed.
    //! Returns false if any building failed.
    bool GenerateAll(unsigned int num_threads);

    std::list<SingleFamilyDwelling> &Buildings();

    const std::list<SingleFamilyDwelling> &Buildings() const;

    //! Returns the distinct material ids used by all layers of all buildings.
    std::set<std::string> UniqueMaterials() const;

    //! Print all buildings.
    void Log() const;

private:
    TypeElementDatabase data;
    UseConditions use_conditions;
    std::list<SingleFamilyDwelling> buildings;
};

#endif //PROJECT_H
