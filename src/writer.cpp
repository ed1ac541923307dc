// Writer is what scriptlets and literal segments output through.
#include <writer.hpp>
#include <unistd.h>
#include <cstring>
#include <defs.h>


FileWriteOutput::FileWriteOutput(int fd, bool owns) {
    file = fd;
    owned = owns;
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
            memcpy(buffer + bufferPos, data, writeSize);
            bufferPos += writeSize;
            data += writeSize;
            length -= writeSize;
        }
    }
}

void FileWriteOutput::flush() {
    size_t done = 0;
    while (done < bufferPos) {
        ssize_t r = ::write(file, buffer + done, bufferPos - done);
        if (r <= 0) {
            printf(ERROR "Couldn't write to file descriptor %d, %zu bytes dropped.\n", file, bufferPos - done);
            perror("\twrite");
            break;
        }
        done += r;
    }
    bufferPos = 0;
}

FileWriteOutput::~FileWriteOutput() {
    flush();
    if (owned) {
        ::close(file);
    }
}

void StringWriteOutput::write(const char* data, size_t length) {
    content.append(data, length);
}


Writer::Writer(WriteOutput& out, bool flushEveryLine) : output(out), flushLines(flushEveryLine) {}

void Writer::write(const char* data, size_t length) {
    std::lock_guard<std::mutex> lock(m_mutex);
    output.write(data, length);
    if (flushLines && memchr(data, '\n', length) != NULL) {
        output.flush();
    }
}

void Writer::write(std::string data) {
    write(data.c_str(), data.size());
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    output.flush();
}
