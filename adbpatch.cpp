// 将adb公钥写入boot镜像ramdisk的完整流程
#include <sys/stat.h>

#include <base.hpp>

#include "adbpatch.hpp"
#include "bootimg.hpp"
#include "compress.hpp"
#include "cpio.hpp"

using namespace std;

const char *err2name(patch_err err) {
    switch (err) {
    case ERR_NONE:
        return "success";
    case ERR_BAD_MAGIC:
        return "bad boot image magic";
    case ERR_UNSUPPORTED_VERSION:
        return "unsupported boot image header version";
    case ERR_BAD_LAYOUT:
        return "bad boot image layout";
    case ERR_CORRUPT_COMPRESSION:
        return "corrupt ramdisk compression";
    case ERR_MALFORMED_CPIO:
        return "malformed ramdisk cpio";
    }
    return "unknown error";
}

patch_err patch_adb_keys(const uint8_t *image, size_t image_sz,
                         const uint8_t *key, size_t key_sz, vector<uint8_t> &out) {
    boot_img boot;
    if (auto err = boot.parse_image(image, image_sz); err != ERR_NONE)
        return err;

    // 解压ramdisk
    if (!COMPRESSED(boot.r_fmt)) {
        LOGW("! Ramdisk is not a supported compressed format [%s]\n", fmt2name[boot.r_fmt]);
        return ERR_CORRUPT_COMPRESSION;
    }
    vector<uint8_t> raw;
    if (!decompress(boot.r_fmt, boot.ramdisk.data(), boot.ramdisk.size(), raw)) {
        LOGW("! Ramdisk decompression failed\n");
        return ERR_CORRUPT_COMPRESSION;
    }

    // 替换adb_keys条目
    cpio archive;
    if (auto err = archive.load_cpio(raw.data(), raw.size()); err != ERR_NONE)
        return err;
    archive.replace(0644, ADB_KEYS_ENTRY, key, key_sz);
    raw.clear();
    archive.dump(raw);

    // 使用原格式重新压缩
    vector<uint8_t> ramdisk;
    if (!compress(boot.r_fmt, raw.data(), raw.size(), ramdisk)) {
        LOGW("! Ramdisk compression failed\n");
        return ERR_CORRUPT_COMPRESSION;
    }
    boot.ramdisk = std::move(ramdisk);

    vector<uint8_t> img;
    boot.dump(img);
    out = std::move(img);
    return ERR_NONE;
}
