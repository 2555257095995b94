// Copyright 2022 Eric Fichter
#ifndef CONSTRUCTIONDATA_H
#define CONSTRUCTIONDATA_H

#include "headers.h"

//! Construction standard of an archetype.
//! Its string value is the construction type of opaque type elements in the database.
class ConstructionData {

public:
    enum value_type {
        IWU_HEAVY,
        IWU_LIGHT,
        KFW_40,
        KFW_55,
        KFW_70,
        KFW_85,
        KFW_100
    };

    ConstructionData(value_type _value = IWU_HEAVY);

    //! Parses e.g. "iwu_heavy" or "kfw_55". Throws configuration_error for unknown strings.
    static ConstructionData FromString(const std::string &s);

    //! Returns all valid string values.
    static std::list<std::string> ValidValues();

    value_type Value() const;

    //! Returns string value, e.g. "iwu_heavy".
    std::string ToString() const;

    //! Returns "iwu" or "kfw".
    std::string Prefix() const;

    //! Returns true for KfW efficiency building standards.
    bool IsKfw() const;

    //! Construction type of windows matching this standard.
    std::string WindowConstruction() const;

    bool operator==(const ConstructionData &C) const { return value == C.value; }

private:
    value_type value;

    static const std::map<value_type, std::string> &value_to_string();
};

#endif //CONSTRUCTIONDATA_H
