// 流接口定义
#pragma once

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include <vector>

class stream {
public:
    virtual ssize_t read(void *buf, size_t len);
    virtual bool write(const void *buf, size_t len);
    virtual ~stream() = default;
};

using stream_ptr = std::unique_ptr<stream>;

// 过滤流，处理后的数据写入base
class filter_stream : public stream {
public:
    explicit filter_stream(stream_ptr &&base) : base(std::move(base)) {}

    ssize_t read(void *buf, size_t len) override;
    bool write(const void *buf, size_t len) override;
    // final为true表示这是最后一次写入，过滤器需要在此完成收尾
    virtual bool write(const void *buf, size_t len, bool final);

protected:
    stream_ptr base;
};

using filter_strm_ptr = std::unique_ptr<filter_stream>;

// 追加写入内存缓冲区的流
class byte_stream : public stream {
public:
    explicit byte_stream(std::vector<uint8_t> &data) : _data(data) {}

    ssize_t read(void *buf, size_t len) override;
    bool write(const void *buf, size_t len) override;

private:
    std::vector<uint8_t> &_data;
    size_t _pos = 0;
};
