// Copyright 2022 Eric Fichter
#ifndef DEFINITIONS_H
#define DEFINITIONS_H

#define ARCH2ENV_VERSION "0.9"
#define ARCH2ENV_FULLNAME "Archetype-based Building Envelope Generator"
#define ARCH2ENV_NAME "ARCH2ENV"
#define ARCH2ENV_AUTHOR "Eric Fichter"
#define ARCH2ENV_ORGANIZATION "Institute of Energy Efficiency and Sustainable Building at RWTH Aachen University"

#ifndef ARCH2ENV_DATA_DIR
#define ARCH2ENV_DATA_DIR "data"
#endif

//! Kind of a building element. Also the prefix of its keys in the type element database.
enum element_category {
    OUTER_WALL,
    INNER_WALL,
    WINDOW,
    ROOFTOP,
    GROUND_FLOOR,
    CEILING,
    FLOOR,
    DOOR
};

//! Outcome of a type element lookup by year and construction.
enum resolve_status {
    RESOLVED,   // exactly one record was selected and applied
    NO_MATCH,   // no record fits category, year and construction
    AMBIGUOUS   // several records of the same (narrowest) age range fit
};

//! Approximation of inner wall areas of a zone.
enum inner_wall_approach {
    TEASER_DEFAULT,
    TYPICAL_MINUS_OUTER
};

//! Special orientations. Vertical elements use their azimuth in degree.
const double ORIENTATION_UP = -1.0;
const double ORIENTATION_DOWN = -2.0;

//! Invalid configuration value, e.g. an attic type without table entry.
class configuration_error : public std::domain_error {
public:
    configuration_error(const std::string &what) : std::domain_error(what) {}
};

//! Arithmetic fault of the estimation, e.g. zero heated floors.
class arithmetic_error : public std::domain_error {
public:
    arithmetic_error(const std::string &what) : std::domain_error(what) {}
};

//! Key or id not present in a database.
class not_found_error : public std::out_of_range {
public:
    not_found_error(const std::string &what) : std::out_of_range(what) {}
};

//! Layer definition of a type element record.
struct layer_record {
    std::string id;
    double thickness;
    std::string material_id;
    std::string material_name;

    layer_record(std::string _id, double _thickness, std::string _material_id, std::string _material_name) : id(std::move(_id)), thickness(_thickness), material_id(std::move(_material_id)), material_name(std::move(_material_name)) {}
};

//! One construction of the type element database. Coefficients not given in the file are NaN.
struct type_element_record {
    std::string key;
    int age_min;
    int age_max;
    std::string construction_type;
    double inner_radiation;
    double inner_convection;
    double outer_radiation;
    double outer_convection;
    double g_value;
    double a_conv;
    double shading_g_total;
    double shading_max_irr;
    std::vector<layer_record> layers;

    bool Contains(int year) const { return age_min <= year && year <= age_max; }
};

//! Material template of the material database.
struct material_record {
    std::string id;
    std::string name;
    double density;
    double thermal_conduc;
    double heat_capac;
    double solar_absorp;
    double ir_emissivity;
};

//! Zone definition of an archetype. Overrides <= 0 mean "inherit from building".
struct zone_definition {
    std::string name;
    double area_fraction;
    std::string usage;
    int number_of_floors;
    double height_of_floors;

    zone_definition(std::string _name, double _area_fraction, std::string _usage, int _number_of_floors = 0, double _height_of_floors = 0) : name(std::move(_name)), area_fraction(_area_fraction), usage(std::move(_usage)), number_of_floors(_number_of_floors), height_of_floors(_height_of_floors) {}
};

//! Name, tilt and orientation of an element instance created per zone.
struct element_placement {
    std::string name;
    double tilt;
    double orientation;

    element_placement(std::string _name, double _tilt, double _orientation) : name(std::move(_name)), tilt(_tilt), orientation(_orientation) {}
};

#endif //DEFINITIONS_H
