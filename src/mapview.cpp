#include <mapview.hpp>
#include <fcntl.h>
#include <defs.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>


MapView::MapView(std::string filename) {
    fd = open(filename.c_str(), O_RDONLY);
    if (fd == -1) {
        printf(ERROR "Can't open %s for memory mapping!\n", filename.c_str());
        perror("\topen");
        return;
    }
    struct stat sb;
    if (fstat(fd, &sb)) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tfstat");
        return;
    }
    if (sb.st_size == 0) { // mmap refuses zero-length maps, but an empty document is still a document
        valid = true;
        return;
    }
    char* mm = (char*)mmap(0, sb.st_size, PROT_READ, MAP_SHARED, fd, 0);
    if (mm == MAP_FAILED) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tmmap");
        return;
    }
    map = mm;
    length = sb.st_size;
    valid = true;
}

MapView::~MapView() {
    if (map != NULL) {
        munmap(map, length);
    }
    if (fd != -1) {
        close(fd);
    }
}

bool MapView::isValid() {
    return valid;
}

std::string MapView::toString() {
    if (map == NULL) {
        return "";
    }
    return std::string(map, length);
}

int64_t MapView::mtime() {
    struct stat sb;
    if (fd == -1 || fstat(fd, &sb) != 0) {
        return -1;
    }
    return (int64_t)sb.st_mtim.tv_sec * 1000 + sb.st_mtim.tv_nsec / 1000000;
}
