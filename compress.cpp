// 压缩/解压缩实现文件，ramdisk使用gzip格式
#include <memory>

#include <zlib.h>

#include <base.hpp>

#include "compress.hpp"

using namespace std;

#define bwrite this->base->write

constexpr size_t CHUNK = 0x40000;           // 256KB输出块
constexpr int GZIP_WBITS = 15 | 16;         // 只接受/生成gzip封装

// gzip流公共部分：输入送入zlib，输出逐块写入下游
class gz_strm : public filter_stream {
public:
    bool write(const void *buf, size_t len) override {
        return len == 0 || feed(buf, len, Z_NO_FLUSH);
    }

    bool write(const void *buf, size_t len, bool final) override {
        if (!write(buf, len))
            return false;
        return !final || finish();
    }

protected:
    gz_strm(const char *op, stream_ptr &&base) :
        filter_stream(std::move(base)), strm{}, op(op) {}

    z_stream strm;
    bool broken = false;     // 出错后拒绝继续写入

    void init_failed(int code) {
        LOGE("gzip %s initialization failed (%d)\n", op, code);
        broken = true;
    }

    virtual int run(int flush) = 0;
    // 读到流结尾时调用，返回true表示还有数据需要继续处理
    virtual bool stream_end() { return false; }

    virtual bool feed(const void *buf, size_t len, int flush) {
        if (broken)
            return false;
        strm.next_in = (Bytef *) buf;
        strm.avail_in = len;
        return pump(flush);
    }

    virtual bool finish() {
        return feed(nullptr, 0, Z_FINISH);
    }

    bool pump(int flush) {
        for (;;) {
            strm.next_out = outbuf.get();
            strm.avail_out = CHUNK;
            int code = run(flush);
            if (code == Z_STREAM_ERROR || code == Z_DATA_ERROR ||
                code == Z_MEM_ERROR || code == Z_NEED_DICT) {
                LOGW("gzip %s failed (%d)\n", op, code);
                broken = true;
                return false;
            }
            if (!bwrite(outbuf.get(), CHUNK - strm.avail_out))
                return false;
            if (code == Z_STREAM_END) {
                if (!stream_end())
                    return !broken;
            } else if (strm.avail_out != 0) {
                return true;
            }
        }
    }

private:
    const char *op;
    unique_ptr<uint8_t[]> outbuf = make_unique<uint8_t[]>(CHUNK);
};

// gzip解码器，支持连续的多个gzip成员，最后一个成员之后的其他数据丢弃
class gz_decoder : public gz_strm {
public:
    explicit gz_decoder(stream_ptr &&base) : gz_strm("decode", std::move(base)) {
        if (int code = inflateInit2(&strm, GZIP_WBITS); code != Z_OK)
            init_failed(code);
    }

    ~gz_decoder() override {
        inflateEnd(&strm);
    }

protected:
    int run(int flush) override {
        return inflate(&strm, flush);
    }

    bool stream_end() override {
        ended = true;
        if (strm.avail_in == 0)
            return false;
        if (strm.avail_in == 1 && strm.next_in[0] == 0x1f) {
            // 只剩一个字节，下一次写入时再判断是否为gzip头部
            split = true;
            strm.avail_in = 0;
            return false;
        }
        if (strm.avail_in > 1 && strm.next_in[0] == 0x1f && strm.next_in[1] == 0x8b)
            return next_member();
        LOGD("gzip: skip %u bytes of trailing data\n", strm.avail_in);
        skip = true;
        strm.avail_in = 0;
        return false;
    }

    bool feed(const void *buf, size_t len, int flush) override {
        if (broken)
            return false;
        if (split && len > 0) {
            split = false;
            if (*static_cast<const uint8_t *>(buf) != 0x8b) {
                skip = true;
                return true;
            }
            if (!next_member())
                return false;
            static const Bytef magic = 0x1f;
            if (!gz_strm::feed(&magic, 1, Z_NO_FLUSH))
                return false;
        }
        if (skip || split)
            return true;
        return gz_strm::feed(buf, len, flush);
    }

    bool finish() override {
        if (!feed(nullptr, 0, Z_FINISH))
            return false;
        if (!ended) {
            LOGW("gzip decode failed: truncated stream\n");
            return false;
        }
        return true;
    }

private:
    bool ended = false;      // 当前成员是否已读到gzip尾部
    bool split = false;      // 上一个成员之后只剩下0x1f
    bool skip = false;       // 之后的数据全部丢弃

    bool next_member() {
        ended = false;
        if (int code = inflateReset(&strm); code != Z_OK) {
            LOGW("gzip decode failed: cannot reset stream (%d)\n", code);
            broken = true;
            return false;
        }
        return true;
    }
};

// gzip编码器，固定使用最高压缩级别
class gz_encoder : public gz_strm {
public:
    explicit gz_encoder(stream_ptr &&base) : gz_strm("encode", std::move(base)) {
        int code = deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, GZIP_WBITS, 8, Z_DEFAULT_STRATEGY);
        if (code != Z_OK)
            init_failed(code);
    }

    ~gz_encoder() override {
        deflateEnd(&strm);
    }

protected:
    int run(int flush) override {
        return deflate(&strm, flush);
    }
};

filter_strm_ptr get_encoder(format_t type, stream_ptr &&base) {
    switch (type) {
        case GZIP:
        default:
            return make_unique<gz_encoder>(std::move(base));
    }
}

filter_strm_ptr get_decoder(format_t type, stream_ptr &&base) {
    switch (type) {
        case GZIP:
        default:
            return make_unique<gz_decoder>(std::move(base));
    }
}

bool decompress(format_t type, const void *in, size_t size, vector<uint8_t> &out) {
    auto strm = get_decoder(type, make_unique<byte_stream>(out));
    return strm->write(in, size, true);
}

bool compress(format_t type, const void *in, size_t size, vector<uint8_t> &out) {
    auto strm = get_encoder(type, make_unique<byte_stream>(out));
    return strm->write(in, size, true);
}
