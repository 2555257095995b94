// Copyright 2022 Eric Fichter
#include "EstimationTables.h"

template<typename T>
const T &EstimationTables::lookup(const std::map<int, T> &table, int key, const std::string &axis) {

    auto it = table.find(key);
    if (it == table.end())
        throw configuration_error("No estimation coefficients for " + axis + " = " + std::to_string(key) + " (valid " + std::to_string(table.begin()->first) + " to " + std::to_string(table.rbegin()->first) + ")");
    return it->second;
}

template<typename T>
void EstimationTables::check_coverage(const std::map<int, T> &table, int min, int max, const std::string &axis) {

    if (table.size() != (size_t) (max - min + 1))
        throw configuration_error("Estimation table " + axis + " has entries outside of " + std::to_string(min) + " to " + std::to_string(max));

    for (int i = min; i <= max; i++)
        if (table.find(i) == table.end())
            throw configuration_error("Estimation table " + axis + " has no entry for " + std::to_string(i));
}

EstimationTables::EstimationTables() {

    // 0 no cellar, 1 non heated, 2 partly heated, 3 heated
    heated_cellar = {{0, 0.0},
                     {1, 0.0},
                     {2, 0.5},
                     {3, 1.0}};

    // 0 flat roof, 1 non heated attic, 2 partly heated attic, 3 heated attic
    attic = {{0, {0.0, 1.33, 0.0}},
             {1, {0.0, 0.0,  1.33}},
             {2, {0.5, 0.75, 0.67}},
             {3, {1.0, 1.5,  0.0}}};

    neighbours = {{0, {0.0, 50.0}},
                  {1, {1.0, 30.0}},
                  {2, {2.0, 10.0}}};

    // 0 compact, 1 elongated/complex
    facade_to_floor_area = {{0, 0.66},
                            {1, 0.8}};

    dormer = {{0, 1.0},
              {1, 1.3}};

    check_coverage(heated_cellar, 0, 3, "cellar");
    check_coverage(attic, 0, 3, "attic");
    check_coverage(neighbours, 0, 2, "neighbour_buildings");
    check_coverage(facade_to_floor_area, 0, 1, "residential_layout");
    check_coverage(dormer, 0, 1, "dormer");
}

const EstimationTables &EstimationTables::Instance() {
    static const EstimationTables T;
    return T;
}

double EstimationTables::HeatedCellar(int cellar) const { return lookup(heated_cellar, cellar, "cellar"); }

const attic_coefficients &EstimationTables::Attic(int a) const { return lookup(attic, a, "attic"); }

const neighbour_coefficients &EstimationTables::Neighbours(int neighbour_buildings) const { return lookup(neighbours, neighbour_buildings, "neighbour_buildings"); }

double EstimationTables::FacadeToFloorArea(int layout) const { return lookup(facade_to_floor_area, layout, "residential_layout"); }

double EstimationTables::Dormer(int d) const { return lookup(dormer, d, "dormer"); }
