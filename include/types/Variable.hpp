#pragma once

#include <vector>
#include <string>
#include <types/Value.hpp>
#include <types/Section.hpp>
#include <defs.h>


struct Variable { // an entry in an Environment
    enum Type {
        Number,
        String, // a template, unless the slot referencing it is raw
        Function, // value holds the function name
        Unknown // only ever valid on an unbound parameter. a variable that reaches the slot resolver like this is a bug.
    } type = Unknown;

    std::string name;
    Value value;
    std::vector<Param> params;

    Variable();

    Variable(std::string n, Type t, Value v, std::vector<Param> p = {});

    static Variable fromDefinition(Section& definition);

    static Variable fromValue(std::string n, Value v); // numbers become Number variables, everything else String

    const char* typeName();
};
