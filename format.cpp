// 格式识别实现
#include "format.hpp"

Fmt2Name fmt2name;

#define CHECKED_MATCH(s) (len >= (sizeof(s) - 1) && BUFFER_MATCH(buf, s))

format_t check_fmt(const void *buf, size_t len) {
    if (CHECKED_MATCH(BOOT_MAGIC)) {
        return AOSP;
    } else if (CHECKED_MATCH(GZIP_MAGIC)) {
        return GZIP;
    } else if (CHECKED_MATCH(CPIO_MAGIC)) {
        return CPIO;
    } else {
        return UNKNOWN;
    }
}

const char *Fmt2Name::operator[](format_t fmt) {
    switch (fmt) {
        case AOSP:
            return "aosp";
        case GZIP:
            return "gzip";
        case CPIO:
            return "cpio";
        default:
            return "raw";
    }
}
