// "view" a memory map (or an owned copy of a string)
// provides reference counted unmapping, fancy buffer-ey functions, view slicing, etc
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


class MapView {
    char* map;
    size_t length; // authoritative length of the WHOLE MEMORY MAP
    size_t start; // starting position of this MapView's slice of the memory map
    size_t end; // ending position of this MapView's slice of the memory map
    int* rCount; // counts references to the underlying memory map
    int fd; // file descriptor of the map (useful for statf), -1 for string copies
    bool owned = false; // true if `map` came from malloc rather than mmap

    void init(int, char* mm, size_t size);

    void release();
public:
    MapView(int, char* mm, size_t size);

    MapView(std::string filename);

    static MapView fromString(const std::string& data); // copies data into a heap buffer the view owns

    bool isValid();

    MapView(const MapView& m);

    MapView& operator=(const MapView& m);

    char operator[](int64_t n);

    void operator++(int);

    void operator+=(size_t n);

    int64_t len();

    size_t offset(); // where this view starts, counted from the start of the whole map

    ~MapView();

    MapView slice(size_t from, size_t len);

    std::string toString(); // COPIES! TRY TO AVOID IT!

    bool cmp(const char* cmp, size_t at = 0);

    MapView consume(char until, bool escapeState = false, bool doesEscape = true); // consume bytes until one of them is until (allows escaping by default)

    void trim(); // tosses whitespace towards the `start`.
};
