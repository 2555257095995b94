// Copyright 2022 Eric Fichter
#include "BuildingElement.h"

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();
}

BuildingElement::BuildingElement() {
    area = 0;
    tilt = 0;
    orientation = 0;
    building_age_min = 0;
    building_age_max = 0;
    inner_radiation = NaN;
    inner_convection = NaN;
    layers.clear();
}

void BuildingElement::SetBasicData(const type_element_record &r) {

    double ir = required(r.inner_radiation, "inner_radiation", r);
    double ic = required(r.inner_convection, "inner_convection", r);

    building_age_min = r.age_min;
    building_age_max = r.age_max;
    construction_type = r.construction_type;
    inner_radiation = ir;
    inner_convection = ic;
}

std::string BuildingElement::CategoryName(element_category c) {

    switch (c) {
        case OUTER_WALL:
            return "OuterWall";
        case INNER_WALL:
            return "InnerWall";
        case WINDOW:
            return "Window";
        case ROOFTOP:
            return "Rooftop";
        case GROUND_FLOOR:
            return "GroundFloor";
        case CEILING:
            return "Ceiling";
        case FLOOR:
            return "Floor";
        case DOOR:
            return "Door";
    }
    return "";
}

std::string BuildingElement::TypeName() const { return CategoryName(Category()); }

const std::list<Layer> &BuildingElement::Layers() const { return layers; }

Layer &BuildingElement::AddLayer(const std::string &id, double thickness) {
    layers.emplace_back(id, (unsigned int) layers.size(), thickness);
    return layers.back();
}

void BuildingElement::ClearLayers() { layers.clear(); }

double BuildingElement::TotalThickness() const {

    double d = 0;
    for (const auto &layer: layers)
        d += layer.Thickness();
    return d;
}

double BuildingElement::ConductiveResistance() const {

    double r = 0;
    for (const auto &layer: layers)
        r += layer.Resistance();
    return r;
}

bool BuildingElement::HasTypeData() const { return !std::isnan(inner_convection); }

void BuildingElement::Log() const {

    std::string s = name;
    s.resize(24, ' ');
    std::ostringstream os;
    os << "\t\t" << s;
    os << "\t" << std::setw(11) << TypeName();
    os << "\t" << std::fixed << std::setprecision(1) << std::setw(6) << tilt;
    os << "\t" << std::setw(6) << orientation;
    os << "\t" << std::setprecision(3) << std::setw(10) << area;
    os << "\t" << std::setw(2) << layers.size();
    os << "\t" << std::setw(6) << TotalThickness();
    os << "\t" << std::setw(6) << ConductiveResistance();
    os << "\t" << construction_type;
    std::cout << os.str() << "\n";
}

std::string BuildingElement::Info() const { return TypeName() + ", " + name; }

double BuildingElement::required(double v, const std::string &coefficient, const type_element_record &r) {

    if (std::isnan(v))
        throw not_found_error("Type element " + r.key + " has no " + coefficient);
    return v;
}

OpaqueElement::OpaqueElement() {
    outer_radiation = NaN;
    outer_convection = NaN;
}

void OpaqueElement::SetBasicData(const type_element_record &r) {

    double orad = required(r.outer_radiation, "outer_radiation", r);
    double oconv = required(r.outer_convection, "outer_convection", r);

    BuildingElement::SetBasicData(r);
    outer_radiation = orad;
    outer_convection = oconv;
}

Window::Window() {
    outer_radiation = NaN;
    outer_convection = NaN;
    g_value = NaN;
    a_conv = NaN;
    shading_g_total = NaN;
    shading_max_irr = NaN;
}

void Window::SetBasicData(const type_element_record &r) {

    double orad = required(r.outer_radiation, "outer_radiation", r);
    double oconv = required(r.outer_convection, "outer_convection", r);
    double g = required(r.g_value, "g_value", r);
    double ac = required(r.a_conv, "a_conv", r);
    double sg = required(r.shading_g_total, "shading_g_total", r);
    double si = required(r.shading_max_irr, "shading_max_irr", r);

    BuildingElement::SetBasicData(r);
    outer_radiation = orad;
    outer_convection = oconv;
    g_value = g;
    a_conv = ac;
    shading_g_total = sg;
    shading_max_irr = si;
}
