// Boot镜像处理实现文件
#include <mincrypt/sha.h>
#include <mincrypt/sha256.h>
#include <base.hpp>

#include "bootimg.hpp"

using namespace std;

#define PADDING 15  // 格式化输出时的填充宽度

// v0头部各字段在磁盘上的偏移
enum : size_t {
    OFF_MAGIC           = 0,
    OFF_KERNEL_SIZE     = 8,
    OFF_KERNEL_ADDR     = 12,
    OFF_RAMDISK_SIZE    = 16,
    OFF_RAMDISK_ADDR    = 20,
    OFF_SECOND_SIZE     = 24,
    OFF_SECOND_ADDR     = 28,
    OFF_TAGS_ADDR       = 32,
    OFF_PAGE_SIZE       = 36,
    OFF_HEADER_VERSION  = 40,
    OFF_OS_VERSION      = 44,
    OFF_NAME            = 48,
    OFF_CMDLINE         = 64,
    OFF_ID              = 576,
    OFF_EXTRA_CMDLINE   = 608,
};

static_assert(OFF_EXTRA_CMDLINE + BOOT_EXTRA_ARGS_SIZE == BOOT_HDR_V0_SIZE);

void boot_img_hdr_v0::decode(const uint8_t *buf) {
    memcpy(magic, buf + OFF_MAGIC, BOOT_MAGIC_SIZE);
    kernel_size = read_le32(buf + OFF_KERNEL_SIZE);
    kernel_addr = read_le32(buf + OFF_KERNEL_ADDR);
    ramdisk_size = read_le32(buf + OFF_RAMDISK_SIZE);
    ramdisk_addr = read_le32(buf + OFF_RAMDISK_ADDR);
    second_size = read_le32(buf + OFF_SECOND_SIZE);
    second_addr = read_le32(buf + OFF_SECOND_ADDR);
    tags_addr = read_le32(buf + OFF_TAGS_ADDR);
    page_size = read_le32(buf + OFF_PAGE_SIZE);
    header_version = read_le32(buf + OFF_HEADER_VERSION);
    os_version = read_le32(buf + OFF_OS_VERSION);
    memcpy(name, buf + OFF_NAME, BOOT_NAME_SIZE);
    memcpy(cmdline, buf + OFF_CMDLINE, BOOT_ARGS_SIZE);
    memcpy(id, buf + OFF_ID, BOOT_ID_SIZE);
    memcpy(extra_cmdline, buf + OFF_EXTRA_CMDLINE, BOOT_EXTRA_ARGS_SIZE);
}

void boot_img_hdr_v0::encode(uint8_t *buf) const {
    memcpy(buf + OFF_MAGIC, magic, BOOT_MAGIC_SIZE);
    write_le32(buf + OFF_KERNEL_SIZE, kernel_size);
    write_le32(buf + OFF_KERNEL_ADDR, kernel_addr);
    write_le32(buf + OFF_RAMDISK_SIZE, ramdisk_size);
    write_le32(buf + OFF_RAMDISK_ADDR, ramdisk_addr);
    write_le32(buf + OFF_SECOND_SIZE, second_size);
    write_le32(buf + OFF_SECOND_ADDR, second_addr);
    write_le32(buf + OFF_TAGS_ADDR, tags_addr);
    write_le32(buf + OFF_PAGE_SIZE, page_size);
    write_le32(buf + OFF_HEADER_VERSION, header_version);
    write_le32(buf + OFF_OS_VERSION, os_version);
    memcpy(buf + OFF_NAME, name, BOOT_NAME_SIZE);
    memcpy(buf + OFF_CMDLINE, cmdline, BOOT_ARGS_SIZE);
    memcpy(buf + OFF_ID, id, BOOT_ID_SIZE);
    memcpy(buf + OFF_EXTRA_CMDLINE, extra_cmdline, BOOT_EXTRA_ARGS_SIZE);
}

// 打印头部信息
void boot_img_hdr_v0::print(bool sha256) const {
    LOGI("%-*s [%u]\n", PADDING, "HEADER_VER", header_version);     // 头部版本
    LOGI("%-*s [%u]\n", PADDING, "KERNEL_SZ", kernel_size);         // 内核大小
    LOGI("%-*s [%u]\n", PADDING, "RAMDISK_SZ", ramdisk_size);       // Ramdisk大小
    LOGI("%-*s [%u]\n", PADDING, "SECOND_SZ", second_size);         // 第二阶段大小

    // 解析并打印操作系统版本信息
    if (os_version) {
        int a,b,c,y,m = 0;
        int version = os_version >> 11;         // 版本号部分
        int patch_level = os_version & 0x7ff;   // 补丁级别部分

        // 解析版本号A.B.C
        a = (version >> 14) & 0x7f;
        b = (version >> 7) & 0x7f;
        c = version & 0x7f;
        LOGI("%-*s [%d.%d.%d]\n", PADDING, "OS_VERSION", a, b, c);

        // 解析补丁级别Y-M
        y = (patch_level >> 4) + 2000;          // 年份（从2000年开始）
        m = patch_level & 0xf;                  // 月份
        LOGI("%-*s [%d-%02d]\n", PADDING, "OS_PATCH_LEVEL", y, m);
    }

    LOGI("%-*s [%u]\n", PADDING, "PAGESIZE", page_size);            // 页面大小
    LOGI("%-*s [%.*s]\n", PADDING, "NAME", BOOT_NAME_SIZE, name);   // 产品名称
    // 打印命令行参数（标准+额外）
    LOGI("%-*s [%.*s%.*s]\n", PADDING, "CMDLINE",
         BOOT_ARGS_SIZE, cmdline, BOOT_EXTRA_ARGS_SIZE, extra_cmdline);

    char checksum[BOOT_ID_SIZE * 2 + 1];
    int len = sha256 ? SHA256_DIGEST_SIZE : SHA_DIGEST_SIZE;
    for (int i = 0; i < len; ++i)
        snprintf(checksum + i * 2, 3, "%02x", id[i]);
    LOGI("%-*s [%s]\n", PADDING, "CHECKSUM", checksum);             // 校验和
}

void boot_checksum(const vector<uint8_t> &kernel, const vector<uint8_t> &ramdisk,
                   const vector<uint8_t> &second, bool sha256, uint8_t id[BOOT_ID_SIZE]) {
    HASH_CTX ctx;
    sha256 ? SHA256_init(&ctx) : SHA_init(&ctx);
    uint8_t size[4];
    for (auto blk : { &kernel, &ramdisk, &second }) {
        HASH_update(&ctx, blk->data(), blk->size());
        write_le32(size, blk->size());
        HASH_update(&ctx, size, sizeof(size));
    }
    memset(id, 0, BOOT_ID_SIZE);
    memcpy(id, HASH_final(&ctx), sha256 ? SHA256_DIGEST_SIZE : SHA_DIGEST_SIZE);
}

// 检查块是否越界并复制到对应缓冲区，偏移对齐到下一页
#define get_block(name)                                         \
if (off > sz || sz - off < hdr.name##_size) {                   \
    LOGW("! " #name " exceeds image boundary\n");               \
    return ERR_BAD_LAYOUT;                                      \
}                                                               \
name.assign(addr + off, addr + off + hdr.name##_size);          \
off += hdr.name##_size;                                         \
off = align_to(off, hdr.page_size);

// 解析镜像文件的主要函数
patch_err boot_img::parse_image(const uint8_t *addr, size_t sz) {
    if (check_fmt(addr, sz) != AOSP) {
        LOGW("! Not an Android boot image\n");
        return ERR_BAD_MAGIC;
    }
    if (sz < BOOT_HDR_V0_SIZE) {
        LOGW("! Truncated boot image header\n");
        return ERR_BAD_LAYOUT;
    }
    hdr.decode(addr);

    if (hdr.header_version != 0) {
        LOGW("! Unsupported header version [%u]\n", hdr.header_version);
        return ERR_UNSUPPORTED_VERSION;
    }
    if (hdr.page_size < BOOT_HDR_V0_SIZE || hdr.page_size > BOOT_PAGE_SIZE_MAX) {
        LOGW("! Invalid page size [%u]\n", hdr.page_size);
        return ERR_BAD_LAYOUT;
    }

    // 检查ID字段以确定是否使用SHA256
    sha256 = false;
    for (int i = SHA_DIGEST_SIZE + 4; i < BOOT_ID_SIZE; ++i) {
        if (hdr.id[i]) {
            sha256 = true;
            break;
        }
    }

    hdr.print(sha256);  // 打印头部信息

    // 按顺序获取各个块，第0页为头部
    uint64_t off = hdr.page_size;
    get_block(kernel);        // 获取内核块
    get_block(ramdisk);       // 获取ramdisk块
    get_block(second);        // 获取第二阶段块

    if (!ramdisk.empty()) {
        r_fmt = check_fmt(ramdisk.data(), ramdisk.size());
        LOGI("%-*s [%s]\n", PADDING, "RAMDISK_FMT", fmt2name[r_fmt]);
    }
    return ERR_NONE;
}

// 写入块、更新头部中的大小并填充零到页面边界
#define put_block(name)                                                 \
hdr.name##_size = name.size();                                          \
out.insert(out.end(), name.begin(), name.end());                        \
out.resize(out.size() + align_padding(name.size(), hdr.page_size), 0);

void boot_img::dump(vector<uint8_t> &out) {
    const size_t header = out.size();

    // 头部独占第0页
    out.resize(header + hdr.page_size, 0);
    put_block(kernel);
    put_block(ramdisk);
    put_block(second);

    // 更新校验和
    boot_checksum(kernel, ramdisk, second, sha256, hdr.id);

    // 打印新头部信息
    hdr.print(sha256);

    hdr.encode(out.data() + header);
}
