// Writer is what scriptlets and literal segments output through. It wraps a WriteOutput sink, which is either a
// buffered file descriptor or an in-memory string.
#pragma once
#include <string>
#include <mutex>


struct WriteOutput {
    virtual ~WriteOutput() {}

    virtual void write(const char* data, size_t length) = 0;

    virtual void flush() {}
};


struct FileWriteOutput : WriteOutput {
    const static int BufferSize = 4096; // 4kb buffer
    int file;
    bool owned = true; // close the descriptor on destruction (false for stdout/stderr)
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(int fd, bool owns = true);

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and (if it owns it) close the file.

    void write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    void flush();
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    void write(const char* data, size_t length);
};


struct Writer {
    WriteOutput& output;
    bool flushLines = false; // flush the sink after every newline (useful for interactive output)
    std::mutex m_mutex; // one writer may be shared by several contexts (the error writer usually is)

    Writer(WriteOutput& out, bool flushEveryLine = false);

    void write(const char* data, size_t length);

    void write(std::string data);

    void flush();
};
