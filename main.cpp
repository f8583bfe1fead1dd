// adbpatch主程序文件
#include <cstdlib>
#include <string>

#include <mincrypt/sha.h>
#include <base.hpp>

#include "adbpatch.hpp"
#include "bootimg.hpp"
#include "compress.hpp"
#include "cpio.hpp"

using namespace std;

// 显示使用帮助信息
static void usage(char *arg0) {
    fprintf(stderr,
R"EOF(adbpatch - 将adb公钥写入boot镜像ramdisk的工具

用法: %s <操作> [参数...]

支持的操作:
  patch <bootimg> [keyfile] [outbootimg]
    将[keyfile]的内容作为ramdisk中的adb_keys写入<bootimg>，
    结果保存为[outbootimg]，如果未指定则为'new-boot.img'。
    ramdisk中已有的adb_keys条目会全部被替换，新条目总是
    位于归档的最后。
    如果未指定[keyfile]，使用环境变量ADBPATCH_KEY指定的文件，
    否则使用$HOME/.android/adbkey.pub。
    只支持头部版本0且ramdisk为gzip压缩的镜像。
    返回值:
    0:成功    1:错误

  info <bootimg>
    打印<bootimg>的头部信息以及ramdisk中的所有条目

  sha1 <file>
    打印<file>的SHA1校验和

环境变量:
  ADBPATCH_DEBUG=true
    输出调试日志
)EOF", arg0);

    fprintf(stderr, "\n");
    exit(1);
}

// 确定公钥文件路径，命令行参数优先，其次是环境变量，最后是默认位置
static string key_path(const char *arg) {
    if (arg)
        return arg;
    if (const char *env = getenv(ADB_KEY_ENV); env && env[0])
        return env;
    const char *home = getenv("HOME");
    if (home == nullptr || home[0] == '\0')
        return {};
    return string(home) + "/" ADB_KEY_DEFAULT;
}

static int patch(const char *image, const char *key_arg, const char *out_img) {
    string key_file = key_path(key_arg);
    if (key_file.empty()) {
        LOGE("Cannot locate adb public key, please set %s\n", ADB_KEY_ENV);
        return 1;
    }

    mmap_data img(image);
    if (!img.ok())
        return 1;
    mmap_data key(key_file.data());
    if (!key.ok())
        return 1;

    fprintf(stderr, "Patching image: [%s]\n", image);
    fprintf(stderr, "With adb key: [%s]\n", key_file.data());

    vector<uint8_t> out;
    if (auto err = patch_adb_keys(img.buf, img.sz, key.buf, key.sz, out); err != ERR_NONE) {
        LOGE("! Cannot patch [%s]: %s\n", image, err2name(err));
        return 1;
    }

    fprintf(stderr, "Repack to image: [%s]\n", out_img);
    return write_file(out_img, out.data(), out.size()) ? 0 : 1;
}

// 打印头部与ramdisk条目
static int info(const char *image) {
    mmap_data img(image);
    if (!img.ok())
        return 1;

    fprintf(stderr, "Parsing image: [%s]\n", image);
    boot_img boot;
    if (auto err = boot.parse_image(img.buf, img.sz); err != ERR_NONE) {
        LOGE("! Cannot parse [%s]: %s\n", image, err2name(err));
        return 1;
    }
    if (!COMPRESSED(boot.r_fmt))
        return 0;

    vector<uint8_t> raw;
    if (!decompress(boot.r_fmt, boot.ramdisk.data(), boot.ramdisk.size(), raw)) {
        LOGE("! Cannot parse [%s]: %s\n", image, err2name(ERR_CORRUPT_COMPRESSION));
        return 1;
    }
    cpio archive;
    if (auto err = archive.load_cpio(raw.data(), raw.size()); err != ERR_NONE) {
        LOGE("! Cannot parse [%s]: %s\n", image, err2name(err));
        return 1;
    }
    for (auto &e : archive.list()) {
        printf("%06o %5u %5u %10zu %s\n",
               e->mode, e->uid, e->gid, e->data.size(), e->name.data());
    }
    return 0;
}

// 主函数
int main(int argc, char *argv[]) {
    cmdline_logging(check_env(DEBUG_ENV));

    if (argc < 2)
        usage(argv[0]);

    // 为了向后兼容，跳过'--'
    string_view action(argv[1]);
    if (str_starts(action, "--"))
        action = argv[1] + 2;

    if (argc > 2 && action == "sha1") {
        uint8_t sha1[SHA_DIGEST_SIZE];
        mmap_data m(argv[2]);                    // 映射文件到内存
        if (!m.ok())
            return 1;
        SHA_hash(m.buf, m.sz, sha1);             // 计算SHA1哈希
        for (uint8_t i : sha1)
            printf("%02x", i);                   // 打印十六进制哈希值
        printf("\n");
    } else if (argc > 2 && action == "patch") {
        const char *key = argc > 3 ? argv[3] : nullptr;
        const char *out = argc > 4 ? argv[4] : NEW_BOOT;
        return patch(argv[2], key, out);         // 写入adb公钥
    } else if (argc > 2 && action == "info") {
        return info(argv[2]);                    // 打印镜像信息
    } else {
        usage(argv[0]);                          // 显示使用帮助
    }

    return 0;
}
