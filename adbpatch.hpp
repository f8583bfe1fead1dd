// adbpatch主要接口定义
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <vector>

// 名称常量定义
#define ADB_KEYS_ENTRY  "adb_keys"       // ramdisk中的adb公钥条目
#define NEW_BOOT        "new-boot.img"   // 新的boot镜像
#define ADB_KEY_ENV     "ADBPATCH_KEY"   // 指定公钥文件的环境变量
#define DEBUG_ENV       "ADBPATCH_DEBUG" // 打开调试日志的环境变量
#define ADB_KEY_DEFAULT ".android/adbkey.pub"  // 相对于$HOME的默认公钥文件

// 错误码，所有错误对单次调用都是致命的
enum patch_err {
    ERR_NONE,                   // 成功
    ERR_BAD_MAGIC,              // 不是boot镜像
    ERR_UNSUPPORTED_VERSION,    // 头部版本不受支持
    ERR_BAD_LAYOUT,             // 页面大小无效或数据块越界
    ERR_CORRUPT_COMPRESSION,    // ramdisk压缩流损坏
    ERR_MALFORMED_CPIO,         // ramdisk中的cpio归档格式错误
};

const char *err2name(patch_err err);

// 将key作为adb_keys写入boot镜像的ramdisk，成功时结果写入out
patch_err patch_adb_keys(const uint8_t *image, size_t image_sz,
                         const uint8_t *key, size_t key_sz, std::vector<uint8_t> &out);
