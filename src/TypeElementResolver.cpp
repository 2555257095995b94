// Copyright 2022 Eric Fichter
#include "TypeElementResolver.h"

resolve_status TypeElementResolver::load_type_element(BuildingElement &element, int year, const std::string &construction, const TypeElementDatabase &data, const std::string &element_type, bool reverse_layers) {

    const std::string category = element_type.empty() ? element.TypeName() : element_type;

    resolve_status status;
    const type_element_record *r = data.Select(category, year, construction, status);

    if (status == RESOLVED)
        apply_record(element, *r, data, reverse_layers);

    return status;
}

void TypeElementResolver::load_type_element_by_key(BuildingElement &element, const std::string &key, const TypeElementDatabase &data, bool reverse_layers) {
    apply_record(element, data.Find(key), data, reverse_layers);
}

void TypeElementResolver::load_material_id(Material &material, const std::string &material_id, const TypeElementDatabase &data) {
    material.SetFromTemplate(data.FindMaterial(material_id));
}

std::string TypeElementResolver::status_to_string(resolve_status s) {

    switch (s) {
        case RESOLVED:
            return "resolved";
        case NO_MATCH:
            return "no matching type element";
        case AMBIGUOUS:
            return "ambiguous type elements";
    }
    return "";
}

void TypeElementResolver::apply_record(BuildingElement &element, const type_element_record &r, const TypeElementDatabase &data, bool reverse_layers) {

    // Check materials first, the element must stay untouched if anything is missing
    for (const auto &l: r.layers)
        data.FindMaterial(l.material_id);

    element.SetBasicData(r);
    element.type_element_key = r.key;
    element.ClearLayers();

    auto add = [&](const layer_record &l) {
        Layer &layer = element.AddLayer(l.id, l.thickness);
        load_material_id(layer.RelMaterial(), l.material_id, data);
    };

    if (reverse_layers)
        for (auto it = r.layers.rbegin(); it != r.layers.rend(); ++it) add(*it);
    else
        for (const auto &l: r.layers) add(l);
}
