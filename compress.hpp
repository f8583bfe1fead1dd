// 压缩/解压缩头文件，定义压缩相关的接口
#pragma once

#include <vector>

#include <stream.hpp>

#include "format.hpp"

// 获取编码器流
filter_strm_ptr get_encoder(format_t type, stream_ptr &&base);

// 获取解码器流
filter_strm_ptr get_decoder(format_t type, stream_ptr &&base);

// 将in解压缩并追加到out，流损坏时返回false
bool decompress(format_t type, const void *in, size_t size, std::vector<uint8_t> &out);

// 以最高压缩级别压缩in并追加到out
bool compress(format_t type, const void *in, size_t size, std::vector<uint8_t> &out);
