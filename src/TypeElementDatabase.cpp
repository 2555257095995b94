// Copyright 2022 Eric Fichter
#include "TypeElementDatabase.h"

namespace pt = boost::property_tree;

TypeElementDatabase::TypeElementDatabase() {
    records.clear();
    record_index.clear();
    materials.clear();
}

bool TypeElementDatabase::Load(const std::string &type_elements_path, const std::string &materials_path) {

    std::cout << "Read type elements " << type_elements_path << "\n";
    std::cout << "Read material templates " << materials_path << "\n";

    auto start = std::chrono::high_resolution_clock::now();

    std::ifstream type_elements(type_elements_path);
    if (!type_elements.good()) {
        std::cerr << "[Error] Could not open '" << type_elements_path << "'." << std::endl;
        return false;
    }

    std::ifstream mats(materials_path);
    if (!mats.good()) {
        std::cerr << "[Error] Could not open '" << materials_path << "'." << std::endl;
        return false;
    }

    try { Read(type_elements, mats); }
    catch (const std::exception &e) {
        std::cerr << "[Error] Database could not be read. " << e.what() << std::endl;
        return false;
    }

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << "[Info] " << records.size() << " type elements and " << materials.size() << " materials (version " << version << ").\n";
    std::cout << "\tElapsed time: " << elapsed.count() << " s\n";

    return true;
}

void TypeElementDatabase::Read(std::istream &type_elements, std::istream &mats) {

    pt::ptree root_elements, root_materials;
    pt::read_json(type_elements, root_elements);
    pt::read_json(mats, root_materials);

    // on error nothing of the previous state is changed
    TypeElementDatabase D;
    D.read_type_elements(root_elements);
    D.read_materials(root_materials);

    records.swap(D.records);
    record_index.swap(D.record_index);
    materials.swap(D.materials);
    version.swap(D.version);
}

void TypeElementDatabase::read_type_elements(const pt::ptree &root) {

    for (const auto &child: root) {

        if (child.first == "version") {
            version = child.second.data();
            continue;
        }

        if (record_index.find(child.first) != record_index.end())
            throw configuration_error("Type element key " + child.first + " is not unique");

        record_index[child.first] = records.size();
        records.push_back(read_record(child.first, child.second));
    }
}

void TypeElementDatabase::read_materials(const pt::ptree &root) {

    for (const auto &child: root) {

        if (child.first == "version")
            continue;

        material_record m;
        m.id = child.first;
        m.name = child.second.get<std::string>("name", "");
        m.density = child.second.get<double>("density");
        m.thermal_conduc = child.second.get<double>("thermal_conduc");
        m.heat_capac = child.second.get<double>("heat_capac");
        m.solar_absorp = child.second.get<double>("solar_absorp", 0.7);
        m.ir_emissivity = child.second.get<double>("ir_emissivity", 0.9);

        if (!materials.emplace(m.id, m).second)
            throw configuration_error("Material id " + m.id + " is not unique");
    }
}

type_element_record TypeElementDatabase::read_record(const std::string &key, const pt::ptree &node) {

    type_element_record r;
    r.key = key;

    auto age = node.get_child_optional("building_age_group");
    if (!age) age = node.get_child_optional("age_range");
    if (!age)
        throw configuration_error("Type element " + key + " has no building_age_group");

    std::vector<int> bounds;
    for (const auto &b: *age)
        bounds.push_back(b.second.get_value<int>());

    if (bounds.size() != 2)
        throw configuration_error("Type element " + key + " needs two bounds of building_age_group");
    if (bounds[0] > bounds[1])
        throw configuration_error("Type element " + key + " has lower age bound above upper bound");

    r.age_min = bounds[0];
    r.age_max = bounds[1];
    r.construction_type = node.get<std::string>("construction_type");
    r.inner_radiation = optional_value(node, "inner_radiation");
    r.inner_convection = optional_value(node, "inner_convection");
    r.outer_radiation = optional_value(node, "outer_radiation");
    r.outer_convection = optional_value(node, "outer_convection");
    r.g_value = optional_value(node, "g_value");
    r.a_conv = optional_value(node, "a_conv");
    r.shading_g_total = optional_value(node, "shading_g_total");
    r.shading_max_irr = optional_value(node, "shading_max_irr");

    auto layers = node.get_child_optional("layer");
    if (layers)
        for (const auto &l: *layers) {
            double thickness = l.second.get<double>("thickness");
            if (thickness <= 0)
                throw configuration_error("Layer " + l.first + " of type element " + key + " has no positive thickness");
            r.layers.emplace_back(l.first, thickness, l.second.get<std::string>("material.material_id"), l.second.get<std::string>("material.name", ""));
        }

    return r;
}

double TypeElementDatabase::optional_value(const pt::ptree &node, const std::string &name) {

    auto v = node.get_optional<double>(name);
    if (v) return *v;
    return std::numeric_limits<double>::quiet_NaN();
}

const type_element_record &TypeElementDatabase::Find(const std::string &key) const {

    auto it = record_index.find(key);
    if (it == record_index.end())
        throw not_found_error("Type element " + key + " not found");
    return records[it->second];
}

const material_record &TypeElementDatabase::FindMaterial(const std::string &id) const {

    auto it = materials.find(id);
    if (it == materials.end())
        throw not_found_error("Material " + id + " not found");
    return it->second;
}

bool TypeElementDatabase::Contains(const std::string &key) const { return record_index.find(key) != record_index.end(); }

std::list<std::string> TypeElementDatabase::MatchingKeys(const std::string &category, int year, const std::string &construction) const {

    std::list<std::string> keys;
    for (const auto &r: records)
        if (boost::algorithm::starts_with(r.key, category) && r.Contains(year) && r.construction_type == construction)
            keys.push_back(r.key);
    return keys;
}

const type_element_record *TypeElementDatabase::Select(const std::string &category, int year, const std::string &construction, resolve_status &status) const {

    const type_element_record *best = nullptr;
    int best_width = 0;
    bool tie = false;

    for (const auto &key: MatchingKeys(category, year, construction)) {
        const type_element_record &r = Find(key);
        int width = r.age_max - r.age_min;
        if (best == nullptr || width < best_width) {
            best = &r;
            best_width = width;
            tie = false;
        } else if (width == best_width)
            tie = true;
    }

    if (best == nullptr) {
        status = NO_MATCH;
        return nullptr;
    }

    if (tie) {
        status = AMBIGUOUS;
        return nullptr;
    }

    status = RESOLVED;
    return best;
}

const std::vector<type_element_record> &TypeElementDatabase::Records() const { return records; }

size_t TypeElementDatabase::NumberOfMaterials() const { return materials.size(); }

std::string TypeElementDatabase::Version() const { return version; }
