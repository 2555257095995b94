// Copyright 2022 Eric Fichter
#ifndef ESTIMATIONTABLES_H
#define ESTIMATIONTABLES_H

#include "headers.h"

//! Coefficients of an attic type (f_TB_DG, p_DA, p_OG).
struct attic_coefficients {
    double heated_attic;
    double area_per_floor;
    double area_per_roof;
};

//! Coefficients of a number of neighbour buildings (n_Nachbar, q_Fa).
struct neighbour_coefficients {
    double factor_neighbour;
    double extra_floor_area;
};

//! Coefficient tables of the IWU short method for residential archetypes.
//! One table per configuration axis, each covering its whole domain:
//! cellar 0-3, attic 0-3, neighbours 0-2, layout 0-1, dormer 0-1.
//! Lookups outside the domain throw configuration_error.
class EstimationTables {

public:
    EstimationTables();

    //! Shared instance, the tables are constant.
    static const EstimationTables &Instance();

    //! Heated share of the cellar (f_TB_KG).
    double HeatedCellar(int cellar) const;

    const attic_coefficients &Attic(int attic) const;

    const neighbour_coefficients &Neighbours(int neighbour_buildings) const;

    //! Facade to floor area ratio of the floor layout (p_Fa).
    double FacadeToFloorArea(int layout) const;

    //! Roof area factor of a dormer.
    double Dormer(int dormer) const;

private:
    std::map<int, double> heated_cellar;
    std::map<int, attic_coefficients> attic;
    std::map<int, neighbour_coefficients> neighbours;
    std::map<int, double> facade_to_floor_area;
    std::map<int, double> dormer;

    template<typename T>
    static const T &lookup(const std::map<int, T> &table, int key, const std::string &axis);

    template<typename T>
    static void check_coverage(const std::map<int, T> &table, int min, int max, const std::string &axis);
};

#endif //ESTIMATIONTABLES_H
