// Android Boot镜像处理相关头文件定义
#pragma once

#include <stdint.h>
#include <vector>

#include "format.hpp"
#include "adbpatch.hpp"

/*********************
 * Boot镜像头部结构定义
 *********************/

// https://android.googlesource.com/platform/system/tools/mkbootimg/+/refs/heads/android12-release/include/bootimg/bootimg.h

#define BOOT_MAGIC_SIZE 8               // Boot魔数大小
#define BOOT_NAME_SIZE 16               // Boot名称大小
#define BOOT_ID_SIZE 32                 // Boot ID大小
#define BOOT_ARGS_SIZE 512              // Boot参数大小
#define BOOT_EXTRA_ARGS_SIZE 1024       // Boot额外参数大小
#define BOOT_HDR_V0_SIZE 1632           // v0头部在磁盘上的大小
#define BOOT_PAGE_SIZE_MAX (1 << 20)    // 接受的最大页面大小

/* 头部版本为0时，boot镜像的结构如下:
 *
 * +-----------------+
 * | boot header     | 1 页
 * +-----------------+
 * | kernel          | n 页
 * +-----------------+
 * | ramdisk         | m 页
 * +-----------------+
 * | second stage    | o 页
 * +-----------------+
 *
 * n = (kernel_size + page_size - 1) / page_size
 * m = (ramdisk_size + page_size - 1) / page_size
 * o = (second_size + page_size - 1) / page_size
 *
 * 头部在磁盘上的布局（所有整数均为小端32位）:
 *
 *   0  magic            8     "ANDROID!"
 *   8  kernel_size      4
 *  12  kernel_addr      4
 *  16  ramdisk_size     4
 *  20  ramdisk_addr     4
 *  24  second_size      4
 *  28  second_addr      4
 *  32  tags_addr        4
 *  36  page_size        4
 *  40  header_version   4     只支持0
 *  44  os_version       4
 *  48  name             16
 *  64  cmdline          512
 * 576  id               32    SHA1/SHA256校验和，不足部分补零
 * 608  extra_cmdline    1024
 */

// Boot镜像头部v0结构，通过decode/encode与磁盘格式逐字段转换
struct boot_img_hdr_v0 {
    char magic[BOOT_MAGIC_SIZE];        // Boot魔数

    uint32_t kernel_size;               // 内核大小（字节）
    uint32_t kernel_addr;               // 内核物理加载地址

    uint32_t ramdisk_size;              // Ramdisk大小（字节）
    uint32_t ramdisk_addr;              // Ramdisk物理加载地址

    uint32_t second_size;               // 第二阶段大小（字节）
    uint32_t second_addr;               // 第二阶段物理加载地址

    uint32_t tags_addr;                 // 内核标签物理地址
    uint32_t page_size;                 // 我们假设的flash页面大小
    uint32_t header_version;            // 头部版本

    // 操作系统版本和安全补丁级别。
    // 对于版本"A.B.C"和补丁级别"Y-M-D":
    //   (A、B、C各7位；(Y-2000)7位，M 4位)
    //   os_version = A[31:25] B[24:18] C[17:11] (Y-2000)[10:4] M[3:0]
    uint32_t os_version;                // 操作系统版本

    char name[BOOT_NAME_SIZE];          // ASCII产品名称
    char cmdline[BOOT_ARGS_SIZE];       // 命令行参数
    uint8_t id[BOOT_ID_SIZE];           // 校验和
    char extra_cmdline[BOOT_EXTRA_ARGS_SIZE];  // 额外命令行参数

    // buf至少需要BOOT_HDR_V0_SIZE字节
    void decode(const uint8_t *buf);
    void encode(uint8_t *buf) const;
    void print(bool sha256) const;      // 打印头部信息
};

/******************
 * 完整Boot镜像结构
 ******************/

struct boot_img {
    // Android镜像头部
    boot_img_hdr_v0 hdr{};

    // 原镜像使用SHA256作为ID
    bool sha256 = false;

    // ramdisk的格式
    format_t r_fmt = UNKNOWN;

    // 头部中定义的各个块，解析时从镜像中复制
    std::vector<uint8_t> kernel;        // 内核数据
    std::vector<uint8_t> ramdisk;       // Ramdisk数据
    std::vector<uint8_t> second;        // 第二阶段数据

    // 解析镜像，成功后头部和各个块均可用
    patch_err parse_image(const uint8_t *addr, size_t sz);
    // 按当前块内容更新头部大小与校验和，并按页面对齐导出整个镜像
    void dump(std::vector<uint8_t> &out);
};

// 计算各个块及其小端长度的SHA1/SHA256，结果补零至BOOT_ID_SIZE
void boot_checksum(const std::vector<uint8_t> &kernel, const std::vector<uint8_t> &ramdisk,
                   const std::vector<uint8_t> &second, bool sha256, uint8_t id[BOOT_ID_SIZE]);
