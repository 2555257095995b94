// Copyright 2022 Eric Fichter
#include "Material.h"

Material::Material() {
    density = 0;
    thermal_conduc = 0;
    heat_capac = 0;
    solar_absorp = 0.7;
    ir_emissivity = 0.9;
}

void Material::SetFromTemplate(const material_record &r) {
    id = r.id;
    name = r.name;
    density = r.density;
    thermal_conduc = r.thermal_conduc;
    heat_capac = r.heat_capac;
    solar_absorp = r.solar_absorp;
    ir_emissivity = r.ir_emissivity;
}

std::string Material::Info() const { return name + ", " + id; }
