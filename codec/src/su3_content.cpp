#include "su3_content.hpp"
#include "su3_error.hpp"
#include <zlib.h>
#include <climits>
#include <stdexcept>
#include <string>

namespace su3 {

// windowBits 15 + 16 selects the gzip wrapper instead of zlib's.
static const int kGzipWindowBits = 15 + 16;
static const size_t kChunk = 16 * 1024;
// avail_in is a uInt; larger inputs are fed in slices of at most this size.
static const size_t kMaxSlice = UINT_MAX;

bool is_gzip_file_type(FileType t) {
    return t == FileType::XmlGz || t == FileType::TxtGz;
}

static size_t clamp_slice(size_t slice) {
    return (slice == 0 || slice > kMaxSlice) ? kMaxSlice : slice;
}

std::vector<uint8_t> gunzip_bytes(const std::vector<uint8_t>& gz, size_t slice) {
    slice = clamp_slice(slice);

    z_stream zs{};
    if (inflateInit2(&zs, kGzipWindowBits) != Z_OK)
        throw Error::decompression("inflateInit2 failed");

    const uint8_t* in = gz.data();
    size_t left = gz.size();

    std::vector<uint8_t> out;
    out.reserve(gz.size() * 2);
    uint8_t chunk[kChunk];

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (zs.avail_in == 0 && left > 0) {
            const size_t n = left < slice ? left : slice;
            zs.next_in  = const_cast<Bytef*>(in);
            zs.avail_in = (uInt)n;
            in   += n;
            left -= n;
        }
        zs.next_out  = chunk;
        zs.avail_out = (uInt)sizeof(chunk);

        // Output space is always free here, so Z_BUF_ERROR means the input ran out.
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : ("zlib error " + std::to_string(rc));
            inflateEnd(&zs);
            if (rc == Z_BUF_ERROR)
                msg = "truncated gzip stream";
            throw Error::decompression(msg);
        }
        out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
    }

    inflateEnd(&zs);
    return out;
}

std::vector<uint8_t> gunzip_bytes(const std::vector<uint8_t>& gz) {
    return gunzip_bytes(gz, kMaxSlice);
}

std::vector<uint8_t> gzip_bytes(const std::vector<uint8_t>& data, size_t slice) {
    slice = clamp_slice(slice);

    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                     8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("gzip: deflateInit2 failed");

    const uint8_t* in = data.data();
    size_t left = data.size();

    std::vector<uint8_t> out;
    uint8_t chunk[kChunk];

    int flush = Z_NO_FLUSH;
    while (flush != Z_FINISH) {
        const size_t n = left < slice ? left : slice;
        zs.next_in  = const_cast<Bytef*>(in);
        zs.avail_in = (uInt)n;
        in   += n;
        left -= n;
        flush = left == 0 ? Z_FINISH : Z_NO_FLUSH;

        do {
            zs.next_out  = chunk;
            zs.avail_out = (uInt)sizeof(chunk);
            int rc = deflate(&zs, flush);
            if (rc == Z_STREAM_ERROR) {
                deflateEnd(&zs);
                throw std::runtime_error("gzip: deflate failed, zlib error " + std::to_string(rc));
            }
            out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
        } while (zs.avail_out == 0);
    }

    deflateEnd(&zs);
    return out;
}

std::vector<uint8_t> gzip_bytes(const std::vector<uint8_t>& data) {
    return gzip_bytes(data, kMaxSlice);
}

std::vector<uint8_t> content(const Package& pkg) {
    if (is_gzip_file_type(pkg.file_type))
        return gunzip_bytes(pkg.raw_content);
    return pkg.raw_content;
}

} // namespace su3
