#include <util.hpp>
#include <atomic>
#include <chrono>
// definitions for util functions

static std::atomic<bool> verbose = false;


void setVerbose(bool v) {
    verbose = v;
}

bool isVerbose() {
    return verbose;
}

bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}

std::string trim(std::string thing) {
    size_t start = 0;
    while (start < thing.size() && isWhitespace(thing[start])) {
        start ++;
    }
    size_t end = thing.size();
    while (end > start && isWhitespace(thing[end - 1])) {
        end --;
    }
    return thing.substr(start, end - start);
}

std::string fconcat(std::string one, std::string two) { // sanely glue two filenames together (useful for things like "documents" + "test.lua")
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

std::string extensionOf(std::string path) {
    size_t slash = path.rfind('/');
    size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return path.substr(dot + 1);
}

std::string stemOf(std::string filename) {
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return filename;
    }
    return filename.substr(0, dot);
}

std::string trim2dir(std::string file) {
    size_t slash = file.rfind('/');
    if (slash == std::string::npos) {
        return "";
    }
    return file.substr(0, slash + 1);
}

int64_t modificationTime(std::string path) {
    struct stat sb;
    if (stat(path.c_str(), &sb) != 0) {
        return -1;
    }
    return (int64_t)sb.st_mtim.tv_sec * 1000 + sb.st_mtim.tv_nsec / 1000000;
}

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void lineColumnAt(const std::string& text, size_t position, size_t& cursor, int& line, int& column) {
    while (cursor < position && cursor < text.size()) {
        if (text[cursor] == '\n') {
            line ++;
            column = 1;
        }
        else {
            column ++;
        }
        cursor ++;
    }
}
