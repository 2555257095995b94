// Copyright 2022 Eric Fichter
#include "Project.h"

Project::Project(std::string _name) : name(std::move(_name)) {
    buildings.clear();
}

bool Project::LoadData(const std::string &type_elements_path, const std::string &materials_path, const std::string &use_conditions_path) {

    std::cout << "\n### Data" << std::endl;

    if (!data.Load(type_elements_path, materials_path))
        return false;

    if (!use_conditions.Load(use_conditions_path))
        return false;

    return true;
}

TypeElementDatabase &Project::Data() { return data; }

UseConditions &Project::Usages() { return use_conditions; }

SingleFamilyDwelling &Project::AddResidential(const std::string &building_name,
                                              int year_of_construction,
                                              int number_of_floors,
                                              double height_of_floors,
                                              double net_leased_area,
                                              ConstructionData construction_data,
                                              int residential_layout,
                                              int neighbour_buildings,
                                              int attic,
                                              int cellar,
                                              int dormer) {

    buildings.emplace_back(building_name, year_of_construction, number_of_floors, height_of_floors, net_leased_area, construction_data, residential_layout, neighbour_buildings, attic, cellar, dormer);
    return buildings.back();
}

bool Project::GenerateAll(unsigned int num_threads) {

    std::cout << "\n### Archetypes" << std::endl;
    std::cout << "Generate " << buildings.size() << " buildings\n";

    auto start = std::chrono::high_resolution_clock::now();

    std::mutex m;
    std::set<const SingleFamilyDwelling *> failed;

    tbb::task_arena arena(num_threads > 0 ? (int) num_threads : (int) tbb::task_arena::automatic);
    arena.execute([&] {
        tbb::parallel_for_each(buildings.begin(), buildings.end(), [&](SingleFamilyDwelling &building) {
            if (!building.GenerateArchetype(data, use_conditions)) {
                std::lock_guard<std::mutex> lock(m);
                failed.insert(&building);
            }
        });
    });

    if (!failed.empty()) {
        std::cerr << "[Warning] " << failed.size() << " buildings could not be generated and are removed from project " << name << "." << std::endl;
        buildings.remove_if([&](const SingleFamilyDwelling &building) { return failed.find(&building) != failed.end(); });
    }

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << "[Info] " << buildings.size() << " buildings generated.\n";
    std::cout << "\tElapsed time: " << elapsed.count() << " s\n";

    return failed.empty();
}

std::list<SingleFamilyDwelling> &Project::Buildings() { return buildings; }

const std::list<SingleFamilyDwelling> &Project::Buildings() const { return buildings; }

std::set<std::string> Project::UniqueMaterials() const {

    std::set<std::string> ids;
    for (const auto &building: buildings)
        for (const auto &e: building.Elements())
            for (const auto &layer: e->Layers())
                ids.insert(layer.RelMaterial().id);
    return ids;
}

void Project::Log() const {

    std::cout << "\n### Buildings" << std::endl;

    for (const auto &building: buildings)
        building.Log();

    std::cout << "\n[Info] " << UniqueMaterials().size() << " distinct materials used in project " << name << ".\n";
}
