#include <algorithm>
#include <cstdio>
#include <cstring>

#include <zlib.h>
#include <mincrypt/sha.h>
#include <mincrypt/sha256.h>
#include <gtest/gtest.h>

#include <base.hpp>

#include "test_util.hpp"

using namespace std;

namespace {

// 测试中关闭所有日志
class quiet_env : public ::testing::Environment {
public:
    void SetUp() override { no_logging(); }
};

const auto *quiet = ::testing::AddGlobalTestEnvironment(new quiet_env);

void pad4(vector<uint8_t> &out) {
    out.resize(align_to(out.size(), 4), 0);
}

} // namespace

vector<uint8_t> to_bytes(string_view s) {
    return vector<uint8_t>(s.begin(), s.end());
}

string as_string(const vector<uint8_t> &v) {
    return string(v.begin(), v.end());
}

vector<uint8_t> gzip_bytes(string_view data, int level) {
    z_stream strm{};
    if (deflateInit2(&strm, level, Z_DEFLATED, 15 | 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        return {};
    vector<uint8_t> out(deflateBound(&strm, data.size()));
    strm.next_in = (Bytef *) data.data();
    strm.avail_in = data.size();
    strm.next_out = out.data();
    strm.avail_out = out.size();
    int code = deflate(&strm, Z_FINISH);
    out.resize(out.size() - strm.avail_out);
    deflateEnd(&strm);
    if (code != Z_STREAM_END)
        return {};
    return out;
}

void newc_append(vector<uint8_t> &out, string_view name, uint32_t mode,
                 string_view data, const newc_meta &meta) {
    char header[NEWC_HDR + 1];
    snprintf(header, sizeof(header), "070701%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x",
             meta.ino, mode, meta.uid, meta.gid, meta.nlink, meta.mtime,
             (uint32_t) data.size(), 0u, 0u, 0u, 0u, (uint32_t) name.size() + 1, 0u);
    out.insert(out.end(), header, header + NEWC_HDR);
    out.insert(out.end(), name.begin(), name.end());
    out.push_back('\0');
    pad4(out);
    out.insert(out.end(), data.begin(), data.end());
    pad4(out);
}

void newc_trailer(vector<uint8_t> &out) {
    newc_append(out, "TRAILER!!!", 0755);
}

uint32_t le32_at(const vector<uint8_t> &buf, size_t off) {
    return read_le32(buf.data() + off);
}

vector<uint8_t> build_boot(const boot_layout &b) {
    vector<uint8_t> img(b.page_size, 0);
    uint8_t *h = img.data();
    memcpy(h, "ANDROID!", 8);
    write_le32(h + 8, b.kernel.size());
    write_le32(h + 12, 0x10008000);
    write_le32(h + 16, b.ramdisk.size());
    write_le32(h + 20, 0x11000000);
    write_le32(h + 24, b.second.size());
    write_le32(h + 28, 0x10f00000);
    write_le32(h + 32, 0x10000100);
    write_le32(h + 36, b.page_size);
    write_le32(h + 40, b.header_version);
    write_le32(h + 44, b.os_version);
    memcpy(h + 48, b.name.data(), min<size_t>(b.name.size(), BOOT_NAME_SIZE));
    memcpy(h + 64, b.cmdline.data(), min<size_t>(b.cmdline.size(), BOOT_ARGS_SIZE));
    memcpy(h + 576, b.id.data(), BOOT_ID_SIZE);
    memcpy(h + 608, "androidboot.selinux=permissive", 30);

    for (auto blk : { &b.kernel, &b.ramdisk, &b.second }) {
        img.insert(img.end(), blk->begin(), blk->end());
        img.resize(align_to(img.size(), b.page_size), 0);
    }
    return img;
}

array<uint8_t, BOOT_ID_SIZE> expected_id(const vector<uint8_t> &kernel,
                                         const vector<uint8_t> &ramdisk,
                                         const vector<uint8_t> &second, bool sha256) {
    vector<uint8_t> all;
    uint8_t size[4];
    for (auto blk : { &kernel, &ramdisk, &second }) {
        all.insert(all.end(), blk->begin(), blk->end());
        write_le32(size, blk->size());
        all.insert(all.end(), size, size + 4);
    }
    array<uint8_t, BOOT_ID_SIZE> id{};
    if (sha256)
        SHA256_hash(all.data(), all.size(), id.data());
    else
        SHA_hash(all.data(), all.size(), id.data());
    return id;
}
