#pragma once
#include <vector>
#include <string>
#include <map>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR     "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "
#define DEBUG     "\033[35m[   DEBUG  ]\033[0m "

#define SHAPER_MAX_RECURSION_DEPTH 5 // how many template-within-template expansions happen before text is passed through unevaluated


struct Value; // forward-declarations for everything, so headers don't have to pull in each other
struct Param;
struct Section;
struct Variable;
struct ParseResult;
struct ShaperError;
struct FunctionRegistry;
struct FileWriteOutput;
struct StringWriteOutput;
struct ShaperWriter;
class MapView;
struct Session;

typedef std::map<std::string, Variable> Environment; // one evaluation scope. nested evaluations get a copy, never a reference.
