// 流实现
#include <algorithm>
#include <cstring>

#include "logging.hpp"
#include "stream.hpp"

ssize_t stream::read(void *, size_t) {
    LOGE("This stream does not implement read\n");
    return -1;
}

bool stream::write(const void *, size_t) {
    LOGE("This stream does not implement write\n");
    return false;
}

ssize_t filter_stream::read(void *buf, size_t len) {
    return base->read(buf, len);
}

bool filter_stream::write(const void *buf, size_t len) {
    return base->write(buf, len);
}

bool filter_stream::write(const void *buf, size_t len, bool) {
    return write(buf, len);
}

ssize_t byte_stream::read(void *buf, size_t len) {
    len = std::min(len, _data.size() - _pos);
    memcpy(buf, _data.data() + _pos, len);
    _pos += len;
    return len;
}

bool byte_stream::write(const void *buf, size_t len) {
    auto p = static_cast<const uint8_t *>(buf);
    _data.insert(_data.end(), p, p + len);
    return true;
}
