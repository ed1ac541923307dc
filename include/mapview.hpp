// read-only memory map of a document file
// documents are copied out of the map exactly once, when their descriptor is built, so a MapView never outlives a load
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


class MapView {
    char* map = NULL;
    size_t length = 0; // length of the whole map (0 for an empty file, which has no map at all)
    int fd = -1; // file descriptor of the map (useful for fstat)
    bool valid = false;

public:
    MapView(std::string filename); // maps the whole file; check isValid() before using it!

    MapView(const MapView&) = delete;

    ~MapView();

    bool isValid();

    std::string toString(); // COPIES!

    int64_t mtime(); // modification time of the mapped file in milliseconds, -1 if it can't be checked
};
