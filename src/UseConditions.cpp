// Copyright 2022 Eric Fichter
#include "UseConditions.h"

bool UseConditions::Load(const std::string &path) {

    std::cout << "Read use conditions " << path << "\n";

    std::ifstream in(path);
    if (!in.good()) {
        std::cerr << "[Error] Could not open '" << path << "'." << std::endl;
        return false;
    }

    try { Read(in); }
    catch (const std::exception &e) {
        std::cerr << "[Error] Use conditions could not be read. " << e.what() << std::endl;
        return false;
    }

    std::cout << "[Info] " << conditions.size() << " use conditions.\n";
    return true;
}

void UseConditions::Read(std::istream &in) {

    boost::property_tree::ptree root;
    boost::property_tree::read_json(in, root);

    std::map<std::string, use_condition> M;

    for (const auto &child: root) {

        if (child.first == "version")
            continue;

        use_condition u;
        u.usage = child.first;
        u.typical_length = child.second.get<double>("typical_length");
        u.typical_width = child.second.get<double>("typical_width");

        if (u.typical_length <= 0 || u.typical_width <= 0)
            throw configuration_error("Usage " + u.usage + " needs positive typical length and width");

        M[u.usage] = u;
    }

    conditions.swap(M);
}

void UseConditions::Add(const use_condition &u) { conditions[u.usage] = u; }

const use_condition &UseConditions::Find(const std::string &usage) const {

    auto it = conditions.find(usage);
    if (it == conditions.end())
        throw not_found_error("Usage " + usage + " not found");
    return it->second;
}

size_t UseConditions::Size() const { return conditions.size(); }
