// 文件工具实现
#include <string>
#include <unistd.h>
#include <sys/mman.h>

#include "files.hpp"
#include "xwrap.hpp"

mmap_data::mmap_data(const char *name, bool rw) {
    int fd = xopen(name, (rw ? O_RDWR : O_RDONLY) | O_CLOEXEC);
    if (fd < 0)
        return;
    struct stat st;
    if (xfstat(fd, &st) == 0) {
        sz = st.st_size;
        if (sz == 0) {
            valid = true;
        } else {
            void *b = xmmap(nullptr, sz, PROT_READ | PROT_WRITE, rw ? MAP_SHARED : MAP_PRIVATE, fd, 0);
            if (b != nullptr) {
                buf = static_cast<uint8_t *>(b);
                valid = true;
            } else {
                sz = 0;
            }
        }
    }
    close(fd);
}

mmap_data::~mmap_data() {
    if (buf)
        munmap(buf, sz);
}

bool write_file(const char *path, const void *buf, size_t len) {
    std::string tmp(path);
    tmp += ".tmp";
    int fd = xopen(tmp.data(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        return false;
    bool ok = xwrite(fd, buf, len) == static_cast<ssize_t>(len);
    if (close(fd) != 0)
        ok = false;
    if (!ok) {
        unlink(tmp.data());
        return false;
    }
    if (xrename(tmp.data(), path) != 0) {
        unlink(tmp.data());
        return false;
    }
    return true;
}
