// Session is a class that contains the FileMan, the function registry, root configuration data, and any other global properties.
// Sessions should not be mutated except at the start by the main function. Every evaluation gets a pointer to a Session,
// and separate evaluations (on separate threads, too) can share one: the only thing that changes during evaluation is the
// FileMan's map cache, and that's only touched with m_mutex held.
#pragma once
#include <defs.h>
#include <string>
#include <fileman.hpp>
#include <functions.hpp>
#include <mutex>


struct Session {
    std::mutex m_mutex;
    FileMan input; // load() and loadDir() resolve their paths against this
    FunctionRegistry functions;
    int maxRecursionDepth = SHAPER_MAX_RECURSION_DEPTH;
    bool debug = false; // print what the evaluator is doing

    Session(std::string baseDir = "", bool showDebug = false); // registers the built-in functions

    ShaperFunction* functionLookup(const std::string& name);

    bool isFunction(const std::string& name);

    // Session redirects a couple of the functions in input:

    bool read(std::string path, std::string& content); // copy a whole file out of the cache. false if it can't be read.

    FileMan::PathState checkPath(std::string path);

    void lock();

    void unlock();
};
