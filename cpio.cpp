// CPIO归档文件处理实现
#include <sys/stat.h>
#include <algorithm>

#include <base.hpp>

#include "cpio.hpp"
#include "format.hpp"

using namespace std;

#define CPIO_TRAILER "TRAILER!!!"

// CPIO newc头部结构，全部为ASCII字段
struct cpio_newc_header {
    char magic[6];      // 魔数
    char ino[8];        // 索引节点号
    char mode[8];       // 文件模式
    char uid[8];        // 用户ID
    char gid[8];        // 组ID
    char nlink[8];      // 硬链接数
    char mtime[8];      // 修改时间
    char filesize[8];   // 文件大小
    char devmajor[8];   // 设备主号
    char devminor[8];   // 设备次号
    char rdevmajor[8];  // 特殊设备主号
    char rdevminor[8];  // 特殊设备次号
    char namesize[8];   // 文件名大小
    char check[8];      // 校验和
} __attribute__((packed));

static_assert(sizeof(cpio_newc_header) == 110);

// 8位十六进制字符串转换为uint32
static bool x8u(const char *hex, uint32_t &val) {
    val = 0;
    for (int i = 0; i < 8; ++i) {
        char c = hex[i];
        uint32_t d;
        if (c >= '0' && c <= '9')
            d = c - '0';
        else if (c >= 'a' && c <= 'f')
            d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F')
            d = c - 'A' + 10;
        else
            return false;
        val = (val << 4) | d;
    }
    return true;
}

cpio_entry::cpio_entry(string_view name, uint32_t mode) :
name(name), ino(0), mode(mode), uid(0), gid(0), nlink(1), mtime(0),
devmajor(0), devminor(0), rdevmajor(0), rdevminor(0) {}

bool cpio::exists(string_view name) const {
    return any_of(entries.begin(), entries.end(), [&](auto &e) { return e->name == name; });
}

size_t cpio::rm(string_view name) {
    size_t n = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if ((*it)->name == name) {
            LOGI("Remove [%s]\n", (*it)->name.data());
            it = entries.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    return n;
}

void cpio::add(mode_t mode, string_view name, const void *data, size_t sz) {
    auto e = make_unique<cpio_entry>(name, S_IFREG | mode);
    auto p = static_cast<const uint8_t *>(data);
    e->data.assign(p, p + sz);
    entries.push_back(std::move(e));
    LOGI("Add entry [%.*s] (%04o)\n", (int) name.size(), name.data(), (unsigned) mode);
}

void cpio::replace(mode_t mode, string_view name, const void *data, size_t sz) {
    rm(name);
    add(mode, name, data, sz);
}

#define do_out(b, len) { auto p = reinterpret_cast<const uint8_t *>(b); out.insert(out.end(), p, p + (len)); }
#define out_align() out.resize(start + align_to(out.size() - start, 4), 0)

// 导出到缓冲区
void cpio::dump(vector<uint8_t> &out) const {
    const size_t start = out.size();
    char header[111];
    for (auto &e : entries) {
        snprintf(header, sizeof(header), "070701%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x",
                e->ino,
                e->mode,
                e->uid,
                e->gid,
                e->nlink,
                e->mtime,
                (uint32_t) e->data.size(),
                e->devmajor,
                e->devminor,
                e->rdevmajor,
                e->rdevminor,
                (uint32_t) e->name.size() + 1,
                0           // e->check
        );
        do_out(header, 110);
        do_out(e->name.data(), e->name.size() + 1);
        out_align();
        if (!e->data.empty()) {
            do_out(e->data.data(), e->data.size());
            out_align();
        }
    }
    // 写入结尾标记
    snprintf(header, sizeof(header), "070701%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x%08x",
            0, 0755, 0, 0, 1, 0, 0, 0, 0, 0, 0, 11, 0);
    do_out(header, 110);
    do_out(CPIO_TRAILER "\0", 11);
    out_align();
}

#define pos_align(p) p = align_to(p, 4)

// 从缓冲区加载CPIO，失败时保持原有条目不变
patch_err cpio::load_cpio(const uint8_t *buf, size_t sz) {
    entry_list loaded;
    size_t pos = 0;
    for (;;) {
        if (pos > sz || sz - pos < sizeof(cpio_newc_header)) {
            LOGW("bad cpio: truncated header @ %zu\n", pos);
            return ERR_MALFORMED_CPIO;
        }
        auto hdr = reinterpret_cast<const cpio_newc_header *>(buf + pos);
        if (memcmp(hdr->magic, CPIO_MAGIC, 6) != 0) {
            LOGW("bad cpio: wrong magic @ %zu\n", pos);
            return ERR_MALFORMED_CPIO;
        }
        uint32_t ino, mode, uid, gid, nlink, mtime, filesize;
        uint32_t devmajor, devminor, rdevmajor, rdevminor, namesize;
        if (!x8u(hdr->ino, ino) || !x8u(hdr->mode, mode) ||
            !x8u(hdr->uid, uid) || !x8u(hdr->gid, gid) ||
            !x8u(hdr->nlink, nlink) || !x8u(hdr->mtime, mtime) ||
            !x8u(hdr->filesize, filesize) ||
            !x8u(hdr->devmajor, devmajor) || !x8u(hdr->devminor, devminor) ||
            !x8u(hdr->rdevmajor, rdevmajor) || !x8u(hdr->rdevminor, rdevminor) ||
            !x8u(hdr->namesize, namesize)) {
            LOGW("bad cpio: non-hex header field @ %zu\n", pos);
            return ERR_MALFORMED_CPIO;
        }
        pos += sizeof(cpio_newc_header);

        if (namesize == 0) {
            LOGW("bad cpio: empty name @ %zu\n", pos);
            return ERR_MALFORMED_CPIO;
        }
        if (sz - pos < namesize) {
            LOGW("bad cpio: truncated name @ %zu\n", pos);
            return ERR_MALFORMED_CPIO;
        }
        auto name_ptr = reinterpret_cast<const char *>(buf + pos);
        if (name_ptr[namesize - 1] != '\0') {
            LOGW("bad cpio: name not NUL-terminated @ %zu\n", pos);
            return ERR_MALFORMED_CPIO;
        }
        string_view name(name_ptr, namesize - 1);
        pos += namesize;
        pos_align(pos);

        if (name == CPIO_TRAILER) {
            // 结尾标记之后的数据忽略
            entries = std::move(loaded);
            return ERR_NONE;
        }

        if (pos > sz || sz - pos < filesize) {
            LOGW("bad cpio: truncated data of [%s]\n", string(name).data());
            return ERR_MALFORMED_CPIO;
        }
        auto e = make_unique<cpio_entry>(name, mode);
        e->ino = ino;
        e->uid = uid;
        e->gid = gid;
        e->nlink = nlink;
        e->mtime = mtime;
        e->devmajor = devmajor;
        e->devminor = devminor;
        e->rdevmajor = rdevmajor;
        e->rdevminor = rdevminor;
        e->data.assign(buf + pos, buf + pos + filesize);
        loaded.push_back(std::move(e));
        pos += filesize;
        pos_align(pos);
    }
}
