// Copyright 2022 Eric Fichter
#ifndef TYPEELEMENTDATABASE_H
#define TYPEELEMENTDATABASE_H

#include "headers.h"

//! Normative construction records and material templates.
//! Records keep the order of the json file. The database is read-only after loading
//! and can be shared by concurrently generated buildings.
class TypeElementDatabase {

public:
    TypeElementDatabase();

    //! Reads type elements and material templates from json files. Returns false on any error.
    bool Load(const std::string &type_elements_path, const std::string &materials_path);

    //! Reads type elements and material templates from json streams. Throws on any error.
    void Read(std::istream &type_elements, std::istream &materials);

    //! Returns record stored under key. Throws not_found_error.
    const type_element_record &Find(const std::string &key) const;

    //! Returns material template with id. Throws not_found_error.
    const material_record &FindMaterial(const std::string &id) const;

    //! Returns true if key is stored.
    bool Contains(const std::string &key) const;

    //! Returns keys of all records starting with category, containing year and having the construction type, in storage order.
    std::list<std::string> MatchingKeys(const std::string &category, int year, const std::string &construction) const;

    //! Selects the record effective for category, year and construction.
    //! The record with the narrowest age group wins. If several records share the narrowest
    //! age group, status is AMBIGUOUS. Returns nullptr unless status is RESOLVED.
    const type_element_record *Select(const std::string &category, int year, const std::string &construction, resolve_status &status) const;

    //! Returns all records in storage order.
    const std::vector<type_element_record> &Records() const;

    //! Returns number of material templates.
    size_t NumberOfMaterials() const;

    //! Returns version entry of the type element file.
    std::string Version() const;

private:
    std::vector<type_element_record> records;
    std::unordered_map<std::string, size_t> record_index;
    std::unordered_map<std::string, material_record> materials;
    std::string version;

    void read_type_elements(const boost::property_tree::ptree &root);

    void read_materials(const boost::property_tree::ptree &root);

    static type_element_record read_record(const std::string &key, const boost::property_tree::ptree &node);

    static double optional_value(const boost::property_tree::ptree &node, const std::string &name);
};

#endif //TYPEELEMENTDATABASE_H
