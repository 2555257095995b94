// Copyright 2022 Eric Fichter
#ifndef MATERIAL_H
#define MATERIAL_H

#include "headers.h"

//! Thermal material of a layer. Owned by exactly one layer.
class Material {

public:
    Material();

    //! Copies the template values and sets the id.
    void SetFromTemplate(const material_record &r);

    //! Stable id, used to deduplicate materials across buildings.
    std::string id;

    std::string name;

    //! Density in kg/m3.
    double density;

    //! Thermal conductivity in W/(m*K).
    double thermal_conduc;

    //! Specific heat capacity in kJ/(kg*K).
    double heat_capac;

    //! Solar absorption coefficient.
    double solar_absorp;

    //! Longwave emissivity.
    double ir_emissivity;

    //! String with basic info.
    std::string Info() const;
};

#endif //MATERIAL_H
