// Built-in functions: named capabilities a template can call inline ({{load("notes.txt")}}) or bind to a variable.
// The registry is filled once when the Session is built, and only read after that.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <types/Value.hpp>
#include <error.hpp>


typedef std::function<bool(Session* session, std::vector<Value>& args, Value& result, ShaperError& err)> ShaperFunction;


struct FunctionRegistry {
    std::map<std::string, ShaperFunction> functions;

    void add(std::string name, ShaperFunction function);

    bool contains(const std::string& name);

    ShaperFunction* lookup(const std::string& name); // NULL if there's no such function
};


void registerBuiltins(FunctionRegistry& registry); // load, loadDir, random
