// ShaperWriter is a class that outputs rendered text somewhere. When `normalize` is on, it does the output post-processing on the fly.
#pragma once
#include <string>


struct WriteOutput {
    virtual ~WriteOutput(){}

    virtual void write(const char* data, size_t length) = 0;
};


struct FileWriteOutput : WriteOutput {
    const static int BufferSize = 4096; // 4kb buffer
    int file;
    bool move = false;
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(FileWriteOutput& f);

    FileWriteOutput(int fd);

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and close the file.

    bool isValid();

    void write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    void flush();
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    void write(const char* data, size_t length);
};


struct NormalizeState {
    bool started = false; // have we written anything that isn't whitespace yet? until then, whitespace is dropped (leading trim)
    std::string pending; // whitespace we haven't committed to yet. it's only written once something non-whitespace follows it (trailing trim)
};


struct ShaperWriter {
    bool normalize = false; // collapse runs of 3+ newlines to 2, trim leading and trailing whitespace
    NormalizeState normalizeState;
    WriteOutput& output;

    ShaperWriter(WriteOutput& out);

    void normalizeWrite(const char* data, size_t length);

    void write(const char* data, size_t length);

    void write(std::string data);

    void finish(); // anything still pending is trailing whitespace, and gets dropped
};
