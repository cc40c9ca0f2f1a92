// "view" a memory map
// provides reference counted unmapping, fancy buffer-ey functions, view slicing, etc

#include <mapview.hpp>
#include <fcntl.h>
#include <defs.h>
#include <util.hpp>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cstring>
#include <cstdio>
#include <cstdlib>


void MapView::init(int file, char* mm, size_t size) {
    map = mm;
    length = size;
    start = 0;
    end = length;
    fd = file;
}

MapView::MapView(int file, char* mm, size_t size) {
    rCount = new int(1);
    init(file, mm, size);
}

MapView::MapView(std::string filename) {
    rCount = new int(1);
    init(-1, NULL, 0);
    int file = open(filename.c_str(), O_RDONLY);
    fd = file; // so when the destructor calls it gets closed properly
    if (file == -1) {
        printf(ERROR "Can't open %s for memory mapping!\n", filename.c_str());
        perror("\topen");
        return;
    }
    struct stat sb;
    if (fstat(file, &sb)) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tfstat");
        return;
    }
    if (sb.st_size == 0) { // mmap refuses zero-length maps, an empty file is just an empty string
        owned = true;
        init(file, (char*)calloc(1, 1), 0);
        return;
    }
    map = (char*)mmap(0, sb.st_size, PROT_READ, MAP_SHARED, file, 0);
    if (map == MAP_FAILED) {
        map = NULL;
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tmmap");
        return;
    }
    init(file, map, sb.st_size);
}

MapView MapView::fromString(const std::string& data) {
    char* buffer = (char*)malloc(data.size() + 1); // +1 so an empty string still gets a valid buffer
    memcpy(buffer, data.c_str(), data.size() + 1);
    MapView ret(-1, buffer, data.size());
    ret.owned = true;
    return ret;
}

MapView::MapView(const MapView& m) {
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    owned = m.owned;
    (*rCount) ++;
}

MapView& MapView::operator=(const MapView& m) {
    if (this == &m) {
        return *this;
    }
    (*m.rCount) ++;
    release();
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    owned = m.owned;
    return *this;
}

bool MapView::isValid() {
    return map != NULL;
}

char MapView::operator[](int64_t n) {
    if (len() <= 0) {
        return EOF;
    }
    if (n < 0) {
        n = len() + (n % len());
        if (n == len()) {
            n = 0;
        }
    }
    if (n >= len()) {
        return EOF;
    }
    return map[start + n];
}

void MapView::operator++(int) {
    if (start < end) {
        start ++;
    }
}

void MapView::operator+=(size_t n) {
    start += n;
    if (start > end) {
        start = end;
    }
}

int64_t MapView::len() {
    return end - start;
}

size_t MapView::offset() {
    return start;
}

void MapView::release() {
    (*rCount) --;
    if (*rCount == 0) {
        delete rCount;
        if (map != NULL) {
            if (owned) {
                free(map);
            }
            else {
                munmap(map, length);
            }
        }
        if (fd != -1) {
            close(fd);
        }
    }
}

MapView::~MapView() {
    release();
}

MapView MapView::slice(size_t from, size_t len) {
    MapView ret(*this);
    ret.start = start + from;
    ret.end = start + from + len;
    if (ret.end > end) {
        ret.end = end;
    }
    if (ret.start > ret.end) {
        ret.start = ret.end;
    }
    return ret;
}

std::string MapView::toString() { // COPIES! TRY TO AVOID IT!
    if (map == NULL) {
        return "";
    }
    return std::string(map + start, end - start);
}

bool MapView::cmp(const char* cmp, size_t at) {
    size_t cmpLen = strlen(cmp);
    if (start + at > end || end - start - at < cmpLen) { // not enough bytes left to match
        return false;
    }
    for (size_t i = 0; i < cmpLen; i ++) {
        if (map[start + at + i] != cmp[i]) {
            return false;
        }
    }
    return true;
}

MapView MapView::consume(char until, bool escapeState, bool doesEscape) { // consume bytes until one of them is until (allows escaping by default)
    // return the consumed bytes as a child MapView
    // escapeState allows the caller to determine if the first byte is considered to be escaped or not (useful if there's a "master" escape count)
    MapView ret = *this;
    while (len() > 0) {
        if (map[start] == '\\' && doesEscape && !escapeState) {
            escapeState = true;
            start ++;
            continue;
        }
        else if (map[start] == until && !escapeState) {
            break;
        }
        escapeState = false;
        start ++;
    }
    ret.end = start;
    return ret;
}

void MapView::trim() { // tosses whitespace towards the `start`.
    while (start < end && isWhitespace(map[start])) {start ++;} // continue to strip off bytes until they're not whitespace
}
