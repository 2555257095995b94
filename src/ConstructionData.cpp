// Copyright 2022 Eric Fichter
#include "ConstructionData.h"

ConstructionData::ConstructionData(value_type _value) : value(_value) {}

const std::map<ConstructionData::value_type, std::string> &ConstructionData::value_to_string() {

    static const std::map<value_type, std::string> m = {{IWU_HEAVY, "iwu_heavy"},
                                                        {IWU_LIGHT, "iwu_light"},
                                                        {KFW_40,    "kfw_40"},
                                                        {KFW_55,    "kfw_55"},
                                                        {KFW_70,    "kfw_70"},
                                                        {KFW_85,    "kfw_85"},
                                                        {KFW_100,   "kfw_100"}};
    return m;
}

ConstructionData ConstructionData::FromString(const std::string &s) {

    for (const auto &v: value_to_string())
        if (v.second == s)
            return ConstructionData(v.first);

    throw configuration_error("Unknown construction data '" + s + "'. Valid values are " + boost::algorithm::join(ValidValues(), ", "));
}

std::list<std::string> ConstructionData::ValidValues() {

    std::list<std::string> L;
    for (const auto &v: value_to_string())
        L.push_back(v.second);
    return L;
}

ConstructionData::value_type ConstructionData::Value() const { return value; }

std::string ConstructionData::ToString() const { return value_to_string().at(value); }

std::string ConstructionData::Prefix() const { return IsKfw() ? "kfw" : "iwu"; }

bool ConstructionData::IsKfw() const { return value != IWU_HEAVY && value != IWU_LIGHT; }

std::string ConstructionData::WindowConstruction() const {
    // windows only distinguish KfW standards from others
    return IsKfw() ? "Waermeschutzverglasung, dreifach" : "Kunststofffenster, Isolierverglasung";
}
