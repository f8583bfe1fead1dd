// 日志实现
#include <cstdio>

#include "logging.hpp"

static int nop_log(const char *, va_list) {
    return 0;
}

static int vprintfe(const char *fmt, va_list ap) {
    return vfprintf(stderr, fmt, ap);
}

// 默认只输出警告和错误
log_callback log_cb = {
    .d = nop_log,
    .i = nop_log,
    .w = vprintfe,
    .e = vprintfe,
};

void no_logging() {
    log_cb.d = nop_log;
    log_cb.i = nop_log;
    log_cb.w = nop_log;
    log_cb.e = nop_log;
}

void cmdline_logging(bool debug) {
    log_cb.d = debug ? vprintfe : nop_log;
    log_cb.i = vprintfe;
    log_cb.w = vprintfe;
    log_cb.e = vprintfe;
}

int log_handler(log_type t, const char *fmt, ...) {
    va_list argv;
    int ret = 0;
    va_start(argv, fmt);
    switch (t) {
    case L_DEBUG:
        ret = log_cb.d(fmt, argv);
        break;
    case L_INFO:
        ret = log_cb.i(fmt, argv);
        break;
    case L_WARN:
        ret = log_cb.w(fmt, argv);
        break;
    case L_ERR:
        ret = log_cb.e(fmt, argv);
        break;
    case L_LAST:
        break;
    }
    va_end(argv);
    return ret;
}
