/* Fileman is a class that pulls ShaperWriter and MapView all together. It resolves paths against a base directory,
    reads template and data files from it, and creates output files under it.
*/
#pragma once
#include <string>
#include <vector>
#include <defs.h>
#include <map>
#include <mapview.hpp>
#include <writer.hpp>
#include <util.hpp>


class FileMan {
    std::map<std::string, MapView> maps;

public:
    enum PathState {
        CNEP,      // Ce n'existe pas
        Directory, // it's a directory
        File,      // it's a file
        Other,     // it's something else (symlink?)
        Error      // an error occurred when stat'ing it
    };

    PathState checkPath(std::string path);

    std::string transmuted(std::string path); // resolve a path against dir. absolute paths pass through untouched.

    std::string dir;

    FileMan(std::string rdir); // construct the FileMan to manage the directory referenced by rdir. An empty rdir means the working directory.

    FileWriteOutput create(std::string where); // create a file and all of its parent directories, and return the filewriteoutput
    // that controls it. Check isValid() on the result before trusting it.

    MapView open(std::string thing); // memory map a file into the buffer-like MapView, returning an invalid
    // mapview if it doesn't exist (you MUST always check if mapview.isValid()!)
    // open() recycles MapViews, so a file loaded by several slots is only mapped once.

    bool list(std::string directory, std::vector<std::string>& names); // names of the regular files directly inside directory, sorted.
    // returns false if the directory can't be opened.
};
