// ShaperWriter is a class that outputs rendered text somewhere. When `normalize` is on, it does the output post-processing on the fly.
#include <writer.hpp>
#include <unistd.h>
#include <util.hpp>
#include <defs.h>
#include <cstdio>


FileWriteOutput::FileWriteOutput(int fd) {
    file = fd;
}

bool FileWriteOutput::isValid() {
    return file != -1;
}

void FileWriteOutput::write(const char* data, size_t length) {
    while (length > 0) {
        size_t writeSize = BufferSize - bufferPos; // the space remaining
        if (writeSize > length) {
            writeSize = length;
        }
        if (writeSize == 0) {
            flush();
        }
        else {
            for (size_t i = 0; i < writeSize; i ++) {
                buffer[bufferPos + i] = data[i];
            }
            bufferPos += writeSize;
            data += writeSize;
            length -= writeSize;
        }
    }
}

void FileWriteOutput::flush() {
    if (file == -1) {
        bufferPos = 0;
        return;
    }
    size_t written = 0;
    while (written < bufferPos) {
        ssize_t r = ::write(file, buffer + written, bufferPos - written);
        if (r <= 0) {
            printf(ERROR "Couldn't write output. %zu bytes were lost.\n", bufferPos - written);
            perror("\twrite");
            break;
        }
        written += r;
    }
    bufferPos = 0;
}

FileWriteOutput::~FileWriteOutput() {
    if (!move) { // allow this file descriptor to be moved into another FileWriteOutput without being closed.
        flush();
        if (file > 2) { // never close the standard streams out from under the process
            ::close(file);
        }
    }
}

FileWriteOutput::FileWriteOutput(FileWriteOutput& f) {
    file = f.file;
    f.move = true;
}

void StringWriteOutput::write(const char* data, size_t length) {
    content.append(data, length);
}


ShaperWriter::ShaperWriter(WriteOutput& out) : output(out){}

void ShaperWriter::normalizeWrite(const char* data, size_t length) { // whitespace is held back in `pending` until we know it isn't trailing.
    for (size_t i = 0; i < length; i ++) {
        char byte = data[i];
        if (isWhitespace(byte)) {
            if (normalizeState.started) {
                normalizeState.pending += byte;
            }
            continue;
        }
        if (normalizeState.pending.size() > 0) {
            std::string& p = normalizeState.pending;
            size_t x = 0;
            while (x < p.size()) {
                if (p[x] == '\n') {
                    size_t run = 0;
                    while (x + run < p.size() && p[x + run] == '\n') { run ++; }
                    output.write("\n\n", run >= 3 ? 2 : run); // three or more newlines become exactly two
                    x += run;
                }
                else {
                    output.write(&p[x], 1);
                    x ++;
                }
            }
            p.clear();
        }
        normalizeState.started = true;
        output.write(&byte, 1);
    }
}

void ShaperWriter::write(const char* data, size_t length) {
    if (normalize) {
        normalizeWrite(data, length);
    }
    else {
        output.write(data, length);
    }
}

void ShaperWriter::write(std::string data) {
    write(data.c_str(), data.size());
}

void ShaperWriter::finish() {
    normalizeState.pending.clear();
}
