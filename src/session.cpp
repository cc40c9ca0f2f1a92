#include <session.hpp>


Session::Session(std::string baseDir, bool showDebug) : input(baseDir), debug{showDebug} {
    registerBuiltins(functions);
}

ShaperFunction* Session::functionLookup(const std::string& name) {
    return functions.lookup(name);
}

bool Session::isFunction(const std::string& name) {
    return functions.contains(name);
}

bool Session::read(std::string path, std::string& content) {
    std::lock_guard<Session> guard(*this); // the MapView copy below touches the cache entry's reference count too
    MapView file = input.open(path);
    if (!file.isValid()) {
        return false;
    }
    content = file.toString();
    return true;
}

FileMan::PathState Session::checkPath(std::string path) {
    return input.checkPath(path);
}

void Session::lock() {
    m_mutex.lock();
}

void Session::unlock() {
    m_mutex.unlock();
}
