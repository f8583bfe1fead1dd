// 通用小工具
#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

// 向上对齐到a的整数倍
template <class T>
static constexpr T align_to(T v, int a) {
    static_assert(std::is_integral<T>::value);
    return (v + a - 1) / a * a;
}

// 对齐到a的整数倍需要补充的字节数
template <class T>
static constexpr T align_padding(T v, int a) {
    return align_to(v, a) - v;
}

static inline bool str_starts(std::string_view s, std::string_view ss) {
    return s.size() >= ss.size() && s.compare(0, ss.size(), ss) == 0;
}

// 小端读写
static inline uint32_t read_le32(const uint8_t *p) {
    return (uint32_t) p[0] | ((uint32_t) p[1] << 8) | ((uint32_t) p[2] << 16) | ((uint32_t) p[3] << 24);
}

static inline void write_le32(uint8_t *p, uint32_t v) {
    p[0] = v & 0xff;
    p[1] = (v >> 8) & 0xff;
    p[2] = (v >> 16) & 0xff;
    p[3] = (v >> 24) & 0xff;
}

// 环境变量是否为"true"
bool check_env(const char *name);
