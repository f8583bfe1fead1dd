// CPIO归档文件处理头文件
#pragma once

#include <stdint.h>
#include <sys/types.h>
#include <string>
#include <memory>
#include <vector>
#include <string_view>

#include "adbpatch.hpp"

// CPIO条目结构，保留newc头部中的全部元数据
struct cpio_entry {
    std::string name;       // 文件名
    uint32_t ino;           // 索引节点号
    uint32_t mode;          // 文件模式
    uint32_t uid;           // 用户ID
    uint32_t gid;           // 组ID
    uint32_t nlink;         // 硬链接数
    uint32_t mtime;         // 修改时间
    uint32_t devmajor;      // 设备主号
    uint32_t devminor;      // 设备次号
    uint32_t rdevmajor;     // 特殊设备主号
    uint32_t rdevminor;     // 特殊设备次号
    std::vector<uint8_t> data;  // 文件数据，长度即filesize

    explicit cpio_entry(std::string_view name, uint32_t mode = 0);
};

// CPIO归档处理类，条目按归档中的顺序保存
class cpio {
public:
    using entry_list = std::vector<std::unique_ptr<cpio_entry>>;

    // 从内存加载newc格式归档，读到TRAILER!!!为止
    patch_err load_cpio(const uint8_t *buf, size_t sz);
    // 按顺序导出所有条目并追加结尾标记
    void dump(std::vector<uint8_t> &out) const;

    bool exists(std::string_view name) const;
    // 删除所有同名条目，返回删除的数量
    size_t rm(std::string_view name);
    // 在末尾添加常规文件条目
    void add(mode_t mode, std::string_view name, const void *data, size_t sz);
    // 删除所有同名条目后在末尾添加新条目
    void replace(mode_t mode, std::string_view name, const void *data, size_t sz);

    const entry_list &list() const { return entries; }

private:
    entry_list entries;  // 条目列表
};
