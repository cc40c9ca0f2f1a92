#include <functions.hpp>
#include <session.hpp>
#include <random>


void FunctionRegistry::add(std::string name, ShaperFunction function) {
    functions[name] = function;
}

bool FunctionRegistry::contains(const std::string& name) {
    return functions.contains(name);
}

ShaperFunction* FunctionRegistry::lookup(const std::string& name) {
    auto found = functions.find(name);
    if (found == functions.end()) {
        return NULL;
    }
    return &found -> second;
}


static bool loadFiles(Session* session, std::vector<Value>& args, Value& result, ShaperError& err) { // contents of every file named, glued together with a blank line
    if (args.size() == 0) {
        return err.fail(ShaperError::Kind::FunctionFailed, "load", "load needs at least one path");
    }
    std::string content;
    for (size_t i = 0; i < args.size(); i ++) {
        std::string path = args[i].toString();
        if (session -> checkPath(path) == FileMan::PathState::Directory) {
            return err.fail(ShaperError::Kind::FunctionFailed, "load", path + " is a directory, use loadDir");
        }
        std::string file;
        if (!session -> read(path, file)) {
            return err.fail(ShaperError::Kind::FunctionFailed, "load", "can't read " + path);
        }
        if (i > 0) {
            content += "\n\n";
        }
        content += file;
    }
    result = Value(content);
    return true;
}


static bool loadDirectory(Session* session, std::vector<Value>& args, Value& result, ShaperError& err) { // every file in a directory, each one under its own name
    if (args.size() == 0 || args.size() > 2) {
        return err.fail(ShaperError::Kind::FunctionFailed, "loadDir", "loadDir takes a directory and an optional extension");
    }
    std::string directory = args[0].toString();
    std::string extension = args.size() == 2 ? args[1].toString() : "";
    std::vector<std::string> names;
    if (!session -> input.list(directory, names)) {
        return err.fail(ShaperError::Kind::FunctionFailed, "loadDir", "can't list " + directory);
    }
    std::string content;
    bool first = true;
    for (std::string& name : names) {
        if (extension.size() > 0 && !name.ends_with(extension)) {
            continue;
        }
        std::string path = directory + "/" + name;
        std::string file;
        if (!session -> read(path, file)) {
            return err.fail(ShaperError::Kind::FunctionFailed, "loadDir", "can't read " + path);
        }
        if (!first) {
            content += "\n\n";
        }
        first = false;
        content += name + "\n" + file;
    }
    result = Value(content);
    return true;
}


static bool randomPick(Session* session, std::vector<Value>& args, Value& result, ShaperError& err) { // one of the arguments, picked at random
    if (args.size() == 0) {
        return err.fail(ShaperError::Kind::FunctionFailed, "random", "random needs something to pick from");
    }
    std::random_device seed; // an engine per call, so threads sharing a Session never share random state
    std::mt19937 engine(seed());
    std::uniform_int_distribution<size_t> pick(0, args.size() - 1);
    result = args[pick(engine)];
    return true;
}


void registerBuiltins(FunctionRegistry& registry) {
    registry.add("load", loadFiles);
    registry.add("loadDir", loadDirectory);
    registry.add("random", randomPick);
}
