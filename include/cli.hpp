// Command line handling for the shaper executable: reading argv, and turning -js / -jf / -v into the caller's Environment.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <types/Variable.hpp>
#include <error.hpp>


struct VariableEntry {
    std::string name;
    std::string content;
};


struct Options {
    std::string input = "";
    std::string outputFile = "";
    std::string baseDir = "";
    std::string json = ""; // -js, variables as a JSON object
    std::string jsonFile = ""; // -jf, the same from a file
    std::vector<VariableEntry> definitions; // -v name value, applied on top of the JSON ones
    bool hasInput = false;
    bool isString = false;
    bool debug = false;
    bool printSections = false;
    int maxDepth = SHAPER_MAX_RECURSION_DEPTH;
};


bool parseArguments(int argc, char** argv, Options& options); // prints what went wrong and returns false on a bad command line

bool jsonToVariables(const std::string& text, Environment& variables, ShaperError& err); // numbers stay numbers, strings stay strings, anything else is kept as its JSON text

bool buildVariables(Options& options, Environment& variables, ShaperError& err);
