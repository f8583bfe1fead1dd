#include <algorithm>
#include <set>
#include <string>
#include <sys/stat.h>

#include <gtest/gtest.h>

#include <base.hpp>

#include "adbpatch.hpp"
#include "bootimg.hpp"
#include "compress.hpp"
#include "cpio.hpp"
#include "test_util.hpp"

using namespace std;

namespace {

constexpr char KEY1[] = "KEY1";

// 两个条目的ramdisk
vector<uint8_t> two_entry_cpio(string_view key = {}) {
    vector<uint8_t> buf;
    newc_append(buf, "init", S_IFREG | 0750, "#!/system/bin/sh\n", newc_meta{ 1, 0, 0, 1, 1500000000 });
    if (!key.empty())
        newc_append(buf, ADB_KEYS_ENTRY, S_IFREG | 0640, key, newc_meta{ 2 });
    newc_append(buf, "sbin", S_IFDIR | 0750, {}, newc_meta{ 3, 0, 2000, 2 });
    newc_trailer(buf);
    return buf;
}

boot_layout sample_layout(const vector<uint8_t> &cpio_raw) {
    boot_layout b;
    b.page_size = 2048;
    b.kernel = vector<uint8_t>(100, 0x7f);
    b.ramdisk = gzip_bytes(as_string(cpio_raw));
    return b;
}

// 解包输出镜像中的ramdisk
bool unpack_ramdisk(const vector<uint8_t> &img, boot_img &boot, cpio &archive) {
    if (boot.parse_image(img.data(), img.size()) != ERR_NONE)
        return false;
    vector<uint8_t> raw;
    if (!decompress(GZIP, boot.ramdisk.data(), boot.ramdisk.size(), raw))
        return false;
    return archive.load_cpio(raw.data(), raw.size()) == ERR_NONE;
}

} // namespace

TEST(AdbPatchTest, AppendsKeyToRamdisk) {
    auto layout = sample_layout(two_entry_cpio());
    auto img = build_boot(layout);

    vector<uint8_t> out;
    ASSERT_EQ(patch_adb_keys(img.data(), img.size(),
                             (const uint8_t *) KEY1, 4, out), ERR_NONE);

    boot_img boot;
    cpio archive;
    ASSERT_TRUE(unpack_ramdisk(out, boot, archive));

    auto &entries = archive.list();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0]->name, "init");
    EXPECT_EQ(entries[0]->mtime, 1500000000u);
    EXPECT_EQ(entries[1]->name, "sbin");
    EXPECT_EQ(entries[1]->gid, 2000u);
    EXPECT_EQ(entries[2]->name, ADB_KEYS_ENTRY);
    EXPECT_EQ(entries[2]->mode, (uint32_t) (S_IFREG | 0644));
    EXPECT_EQ(as_string(entries[2]->data), KEY1);

    // 内核原样保留，第二阶段为空
    EXPECT_EQ(boot.kernel, layout.kernel);
    EXPECT_TRUE(boot.second.empty());
    EXPECT_EQ(boot.hdr.kernel_size, 100u);
    EXPECT_EQ(boot.hdr.ramdisk_size, boot.ramdisk.size());

    // 校验和按各块内容及长度计算
    auto id = expected_id(boot.kernel, boot.ramdisk, boot.second);
    EXPECT_TRUE(equal(id.begin(), id.end(), out.begin() + 576));

    // 头部1页，内核1页，ramdisk按页对齐
    size_t expected = 2048 + 2048 + align_to(boot.ramdisk.size(), 2048);
    EXPECT_EQ(out.size(), expected);
    EXPECT_EQ(out.size() % 2048, 0u);
}

TEST(AdbPatchTest, KeepsOtherHeaderFields) {
    auto layout = sample_layout(two_entry_cpio());
    layout.os_version = (12 << 25) | ((22 << 4) | 3);
    auto img = build_boot(layout);

    vector<uint8_t> out;
    ASSERT_EQ(patch_adb_keys(img.data(), img.size(),
                             (const uint8_t *) KEY1, 4, out), ERR_NONE);

    // 只有ramdisk大小和id可能改变
    set<size_t> changed;
    for (size_t i = 0; i < BOOT_HDR_V0_SIZE; ++i) {
        if (img[i] != out[i])
            changed.insert(i);
    }
    for (size_t i : changed) {
        bool allowed = (i >= 16 && i < 20) || (i >= 576 && i < 608);
        EXPECT_TRUE(allowed) << "header byte " << i << " changed";
    }
    EXPECT_TRUE(equal(img.begin() + 2048, img.begin() + 4096, out.begin() + 2048));
}

TEST(AdbPatchTest, ReplacesExistingKey) {
    auto img = build_boot(sample_layout(two_entry_cpio("OLD KEY\n")));

    vector<uint8_t> out;
    auto key = to_bytes("NEW KEY\n");
    ASSERT_EQ(patch_adb_keys(img.data(), img.size(), key.data(), key.size(), out), ERR_NONE);

    boot_img boot;
    cpio archive;
    ASSERT_TRUE(unpack_ramdisk(out, boot, archive));
    ASSERT_EQ(archive.list().size(), 3u);
    EXPECT_EQ(archive.list()[0]->name, "init");
    EXPECT_EQ(archive.list()[1]->name, "sbin");
    EXPECT_EQ(archive.list()[2]->name, ADB_KEYS_ENTRY);
    EXPECT_EQ(as_string(archive.list()[2]->data), "NEW KEY\n");
}

TEST(AdbPatchTest, KeepsSecondPayload) {
    auto layout = sample_layout(two_entry_cpio());
    layout.second = vector<uint8_t>(3000, 0x5c);
    auto img = build_boot(layout);

    vector<uint8_t> out;
    ASSERT_EQ(patch_adb_keys(img.data(), img.size(),
                             (const uint8_t *) KEY1, 4, out), ERR_NONE);

    boot_img boot;
    cpio archive;
    ASSERT_TRUE(unpack_ramdisk(out, boot, archive));
    EXPECT_EQ(boot.second, layout.second);
    EXPECT_EQ(boot.hdr.second_size, 3000u);
    auto id = expected_id(boot.kernel, boot.ramdisk, boot.second);
    EXPECT_TRUE(equal(id.begin(), id.end(), out.begin() + 576));
}

TEST(AdbPatchTest, PatchIsIdempotent) {
    auto img = build_boot(sample_layout(two_entry_cpio()));

    vector<uint8_t> once, twice;
    ASSERT_EQ(patch_adb_keys(img.data(), img.size(),
                             (const uint8_t *) KEY1, 4, once), ERR_NONE);
    ASSERT_EQ(patch_adb_keys(once.data(), once.size(),
                             (const uint8_t *) KEY1, 4, twice), ERR_NONE);
    EXPECT_EQ(once, twice);
}

TEST(AdbPatchTest, DifferentKeysGiveDifferentIds) {
    auto img = build_boot(sample_layout(two_entry_cpio()));

    vector<uint8_t> a, b;
    ASSERT_EQ(patch_adb_keys(img.data(), img.size(),
                             (const uint8_t *) "KEY1", 4, a), ERR_NONE);
    ASSERT_EQ(patch_adb_keys(img.data(), img.size(),
                             (const uint8_t *) "KEY2", 4, b), ERR_NONE);
    EXPECT_FALSE(equal(a.begin() + 576, a.begin() + 608, b.begin() + 576));
}

TEST(AdbPatchTest, ErrorsLeaveOutputUntouched) {
    const vector<uint8_t> sentinel = to_bytes("untouched");
    auto key = to_bytes(KEY1);

    auto check = [&](const vector<uint8_t> &img, patch_err expect) {
        vector<uint8_t> out = sentinel;
        EXPECT_EQ(patch_adb_keys(img.data(), img.size(), key.data(), key.size(), out), expect);
        EXPECT_EQ(out, sentinel);
    };

    auto raw = two_entry_cpio();

    // 魔数错误
    auto img = build_boot(sample_layout(raw));
    img[0] = 'X';
    check(img, ERR_BAD_MAGIC);

    // 头部版本
    auto layout = sample_layout(raw);
    layout.header_version = 1;
    check(build_boot(layout), ERR_UNSUPPORTED_VERSION);

    // ramdisk越界
    img = build_boot(sample_layout(raw));
    img.resize(2048 + 2048 + 16);
    check(img, ERR_BAD_LAYOUT);

    // ramdisk未压缩
    layout = sample_layout(raw);
    layout.ramdisk = raw;
    check(build_boot(layout), ERR_CORRUPT_COMPRESSION);

    // ramdisk为空
    layout.ramdisk.clear();
    check(build_boot(layout), ERR_CORRUPT_COMPRESSION);

    // gzip流被截断
    layout = sample_layout(raw);
    layout.ramdisk.resize(layout.ramdisk.size() - 10);
    check(build_boot(layout), ERR_CORRUPT_COMPRESSION);

    // gzip内容不是cpio
    layout = sample_layout(raw);
    layout.ramdisk = gzip_bytes("definitely not a cpio archive");
    check(build_boot(layout), ERR_MALFORMED_CPIO);

    // cpio缺少结尾标记
    raw.resize(raw.size() - 124);
    layout = sample_layout(raw);
    check(build_boot(layout), ERR_MALFORMED_CPIO);
}

TEST(AdbPatchTest, ErrorNames) {
    set<string> seen;
    for (auto err : { ERR_NONE, ERR_BAD_MAGIC, ERR_UNSUPPORTED_VERSION, ERR_BAD_LAYOUT,
                      ERR_CORRUPT_COMPRESSION, ERR_MALFORMED_CPIO }) {
        ASSERT_NE(err2name(err), nullptr);
        seen.insert(err2name(err));
    }
    EXPECT_EQ(seen.size(), 6u);
}
