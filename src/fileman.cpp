// definitions for FileMan

#include <fileman.hpp>
#include <sys/stat.h>
#include <fcntl.h>
#include <dirent.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>


std::string fconcat(std::string one, std::string two) { // sanely glue two filenames together (useful for things like "templates" + "intro.txt")
    if (one.size() == 0) {
        return two;
    }
    if (two.size() == 0) {
        return one;
    }
    if (one[one.size() - 1] == '/' && two[0] == '/') {
        return one.substr(0, one.size() - 1) + two;
    }
    else if (one[one.size() - 1] == '/' || two[0] == '/') {
        return one + two;
    }
    else {
        return one + '/' + two;
    }
}


FileMan::FileMan(std::string rdir) {
    dir = rdir;
}

FileMan::PathState FileMan::checkPath(std::string path) {
    struct stat sb;
    if (stat(transmuted(path).c_str(), &sb) == 0) {
        if (S_ISDIR(sb.st_mode)) {
            return FileMan::PathState::Directory;
        }
        else if (S_ISREG(sb.st_mode)) {
            return FileMan::PathState::File;
        }
        else {
            return FileMan::PathState::Other;
        }
    }
    else if (errno == ENOENT) {
        return FileMan::PathState::CNEP;
    }
    else {
        return FileMan::PathState::Error;
    }
}

FileWriteOutput FileMan::create(std::string name) {
    name = transmuted(name);
    mkdirR(name);
    mode_t mask = umask(0);
    int output = ::open(name.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0664);
    umask(mask);
    if (output == -1) {
        printf(ERROR "Couldn't open output file %s.\n", name.c_str());
        perror("\topen");
    }
    FileWriteOutput fOut(output);
    return fOut;
}

MapView FileMan::open(std::string name) {
    name = transmuted(name);
    if (!maps.contains(name)) {
        MapView m(name);
        if (m.isValid()) {
            maps.insert({ name, m });
        }
        else {
            return m;
        }
    }
    return maps.at(name);
}

bool FileMan::list(std::string directory, std::vector<std::string>& names) {
    std::string path = transmuted(directory);
    DIR* d = opendir(path.c_str());
    if (d == NULL) {
        printf(ERROR "Can't open directory %s!\n", path.c_str());
        perror("\topendir");
        return false;
    }
    struct dirent* entry;
    while ((entry = readdir(d)) != NULL) {
        if (entry -> d_name[0] == '.') { // . and .., and hidden files along with them
            continue;
        }
        struct stat sb;
        if (stat(fconcat(path, entry -> d_name).c_str(), &sb) == 0 && S_ISREG(sb.st_mode)) {
            names.push_back(entry -> d_name);
        }
    }
    closedir(d);
    std::sort(names.begin(), names.end());
    return true;
}

std::string FileMan::transmuted(std::string path) {
    if (path.size() > 0 && path[0] == '/') {
        return path;
    }
    return fconcat(dir, path);
}
