// 文件工具
#pragma once

#include <cstddef>
#include <cstdint>

// 映射整个文件，析构时解除映射
struct mmap_data {
    uint8_t *buf = nullptr;
    size_t sz = 0;

    explicit mmap_data(const char *name, bool rw = false);
    mmap_data(const mmap_data &) = delete;
    mmap_data &operator=(const mmap_data &) = delete;
    ~mmap_data();

    // 打开或映射失败时为false；空文件映射成功但buf为nullptr
    bool ok() const { return valid; }

private:
    bool valid = false;
};

// 将缓冲区写入文件：先写临时文件，成功后再改名
bool write_file(const char *path, const void *buf, size_t len);
