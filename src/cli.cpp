#include <cli.hpp>
#include <mapview.hpp>
#include <util.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstring>
#include <cstdlib>

using json = nlohmann::json;


bool parseArguments(int argc, char** argv, Options& options) {
    bool wasVar = false;
    for (int i = 1; i < argc; i ++) {
        if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            i ++;
            options.outputFile = argv[i];
            wasVar = false;
        }
        else if (strcmp(argv[i], "-b") == 0 && i + 1 < argc) {
            i ++;
            options.baseDir = argv[i];
            wasVar = false;
        }
        else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            i ++;
            options.maxDepth = atoi(argv[i]);
            if (options.maxDepth < 0) {
                printf(WARNING "Max depth %s is negative, nothing will be evaluated\n", argv[i]);
            }
            wasVar = false;
        }
        else if (strcmp(argv[i], "-js") == 0 && i + 1 < argc) {
            i ++;
            options.json = argv[i];
            wasVar = false;
        }
        else if (strcmp(argv[i], "-jf") == 0 && i + 1 < argc) {
            i ++;
            options.jsonFile = argv[i];
            wasVar = false;
        }
        else if (strcmp(argv[i], "-v") == 0 && i + 1 < argc) {
            i ++;
            options.definitions.push_back(VariableEntry{
                argv[i],
                "" });
            wasVar = true;
        }
        else if (strcmp(argv[i], "-s") == 0) {
            options.isString = true;
            wasVar = false;
        }
        else if (strcmp(argv[i], "-d") == 0) {
            options.debug = true;
            wasVar = false;
        }
        else if (strcmp(argv[i], "-p") == 0) {
            options.printSections = true;
            wasVar = false;
        }
        else if (wasVar) {
            options.definitions[options.definitions.size() - 1].content = argv[i];
            wasVar = false;
        }
        else if (!options.hasInput) {
            options.hasInput = true;
            options.input = argv[i];
        }
        else {
            printf(ERROR "Unexpected argument %s\n", argv[i]);
            return false;
        }
    }
    if (options.json.size() > 0 && options.jsonFile.size() > 0) {
        printf(ERROR "-js and -jf can't be used together\n");
        return false;
    }
    if (!options.hasInput) {
        printf(ERROR "Input value is required\n");
        return false;
    }
    return true;
}


bool jsonToVariables(const std::string& text, Environment& variables, ShaperError& err) {
    json data = json::parse(text, nullptr, false); // no exceptions, a bad document comes back discarded
    if (data.is_discarded()) {
        return err.fail(ShaperError::Kind::ParseError, "json", "invalid JSON");
    }
    if (!data.is_object()) {
        return err.fail(ShaperError::Kind::ParseError, "json", "variables must be a JSON object");
    }
    for (auto& item : data.items()) {
        const json& value = item.value();
        if (value.is_number()) {
            variables[item.key()] = Variable::fromValue(item.key(), Value(value.get<double>()));
        }
        else if (value.is_string()) {
            variables[item.key()] = Variable::fromValue(item.key(), Value(value.get<std::string>()));
        }
        else {
            variables[item.key()] = Variable::fromValue(item.key(), Value(value.dump()));
        }
    }
    return true;
}


bool buildVariables(Options& options, Environment& variables, ShaperError& err) {
    if (options.jsonFile.size() > 0) {
        MapView file(options.jsonFile);
        if (!file.isValid()) {
            return err.fail(ShaperError::Kind::ParseError, options.jsonFile, "could not read JSON file");
        }
        if (!jsonToVariables(file.toString(), variables, err)) {
            return false;
        }
    }
    else if (options.json.size() > 0) {
        if (!jsonToVariables(options.json, variables, err)) {
            return false;
        }
    }
    for (VariableEntry& def : options.definitions) {
        if (isNumber(def.content.c_str())) {
            variables[def.name] = Variable::fromValue(def.name, Value(strtod(def.content.c_str(), NULL)));
        }
        else {
            variables[def.name] = Variable::fromValue(def.name, Value(def.content));
        }
    }
    if (options.debug) {
        for (auto& entry : variables) {
            printf(DEBUG "Caller variable %s (%s) = %s\n", entry.first.c_str(), entry.second.typeName(), entry.second.value.toString().c_str());
        }
    }
    return true;
}
