// 日志接口定义
#pragma once

#include <cerrno>
#include <cstdarg>
#include <cstring>

// 日志级别
enum log_type {
    L_DEBUG,    // 调试
    L_INFO,     // 信息
    L_WARN,     // 警告
    L_ERR,      // 错误
    L_LAST
};

// 各级别日志的回调表
struct log_callback {
    int (*d)(const char *fmt, va_list ap);
    int (*i)(const char *fmt, va_list ap);
    int (*w)(const char *fmt, va_list ap);
    int (*e)(const char *fmt, va_list ap);
};

extern log_callback log_cb;

// 不输出任何日志
void no_logging();
// 命令行模式，输出到stderr；debug为true时同时输出调试日志
void cmdline_logging(bool debug = false);

int log_handler(log_type t, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

#define LOGD(...) log_handler(L_DEBUG, __VA_ARGS__)
#define LOGI(...) log_handler(L_INFO, __VA_ARGS__)
#define LOGW(...) log_handler(L_WARN, __VA_ARGS__)
#define LOGE(...) log_handler(L_ERR, __VA_ARGS__)

#define PLOGE(fmt, args...) LOGE(fmt " failed with %d: %s\n", ##args, errno, std::strerror(errno))
