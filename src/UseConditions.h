// Copyright 2022 Eric Fichter
#ifndef USECONDITIONS_H
#define USECONDITIONS_H

#include "headers.h"

//! Typical room dimensions of a usage, needed to approximate inner walls.
struct use_condition {
    std::string usage;
    double typical_length;
    double typical_width;
};

//! Use conditions by usage name. Read-only after loading.
class UseConditions {

public:
    //! Reads use conditions from a json file. Returns false on any error.
    bool Load(const std::string &path);

    //! Reads use conditions from a json stream. Throws on any error.
    void Read(std::istream &in);

    //! Adds or replaces a usage.
    void Add(const use_condition &u);

    //! Returns use condition of usage. Throws not_found_error.
    const use_condition &Find(const std::string &usage) const;

    size_t Size() const;

private:
    std::map<std::string, use_condition> conditions;
};

#endif //USECONDITIONS_H
