// 根据魔数识别镜像及ramdisk的数据格式
#pragma once

#include <cstddef>
#include <cstring>

typedef enum {
    UNKNOWN,        // 无法识别，按原始数据处理
    AOSP,           // Android boot镜像
    GZIP,           // gzip压缩数据
    CPIO,           // 未压缩的newc归档
} format_t;

// 目前只能处理gzip压缩的ramdisk
#define COMPRESSED(fmt)      ((fmt) == GZIP)

// buf开头是否为字符串常量s（不含结尾的NUL）
#define BUFFER_MATCH(buf, s) (memcmp(buf, s, sizeof(s) - 1) == 0)

#define BOOT_MAGIC      "ANDROID!"
#define GZIP_MAGIC      "\x1f\x8b"
#define CPIO_MAGIC      "070701"

class Fmt2Name {
public:
    const char *operator[](format_t fmt);
};

// 检查buf开头的魔数，len不足时不会越界读取
format_t check_fmt(const void *buf, size_t len);

extern Fmt2Name fmt2name;
