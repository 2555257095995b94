// Copyright 2022 Eric Fichter
#ifndef TYPEELEMENTRESOLVER_H
#define TYPEELEMENTRESOLVER_H

#include "headers.h"
#include "BuildingElement.h"
#include "TypeElementDatabase.h"

//! Populates building elements with exchange coefficients and layers of type element records.
class TypeElementResolver {

public:
    //! Loads the record effective for year and construction into element.
    //! element_type overrides the category given by the element itself, e.g. to load an "InnerWall" into a zone border.
    //! reverse_layers adds the layers in reversed order, necessary to keep zone borders consistent.
    //! Unless RESOLVED is returned, element is not changed.
    static resolve_status load_type_element(BuildingElement &element, int year, const std::string &construction, const TypeElementDatabase &data, const std::string &element_type = "", bool reverse_layers = false);

    //! Loads the record stored under key into element. Throws not_found_error if key or a material is missing.
    static void load_type_element_by_key(BuildingElement &element, const std::string &key, const TypeElementDatabase &data, bool reverse_layers = false);

    //! Sets material from the material template with material_id. Throws not_found_error.
    static void load_material_id(Material &material, const std::string &material_id, const TypeElementDatabase &data);

    //! Returns text of a status.
    static std::string status_to_string(resolve_status s);

private:
    static void apply_record(BuildingElement &element, const type_element_record &r, const TypeElementDatabase &data, bool reverse_layers);
};

#endif //TYPEELEMENTRESOLVER_H
