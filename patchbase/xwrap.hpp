// 系统调用包装，失败时输出错误日志并返回原始错误值
#pragma once

#include <stdio.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>

int xopen(const char *pathname, int flags);
int xopen(const char *pathname, int flags, mode_t mode);
ssize_t xwrite(int fd, const void *buf, size_t count);
int xfstat(int fd, struct stat *buf);
int xrename(const char *oldpath, const char *newpath);
void *xmmap(void *addr, size_t length, int prot, int flags, int fd, off_t offset);
