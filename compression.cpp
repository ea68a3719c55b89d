// Section 1: Main Header
#include "compression.h"

// Section 2: Includes
#include <cstring>
#include <string>

// Third-Party Includes
#include <zlib.h>

// Section 3: Defines and Macros
constexpr int GZIP_WINDOW_BITS = 15 + 16;   // 16 selects the gzip wrapper
constexpr int GZIP_MEM_LEVEL = 8;
constexpr size_t INFLATE_CHUNK = 64 * 1024;

// Section 4: Public Methods
int Compression::gzip(std::string_view input, std::string &output)
{
    z_stream stream;
    memset(&stream, 0, sizeof(stream));
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, GZIP_MEM_LEVEL, Z_DEFAULT_STRATEGY) != Z_OK)
        return -1;

    output.resize(deflateBound(&stream, static_cast<uLong>(input.size())) + 32);
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef *>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    int ret = deflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        deflateEnd(&stream);
        output.clear();
        return -1;
    }
    output.resize(stream.total_out);
    deflateEnd(&stream);
    return 0;
}

int Compression::gunzip(std::string_view input, std::string &output)
{
    z_stream stream;
    memset(&stream, 0, sizeof(stream));
    if (inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK)
        return -1;

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    output.clear();
    char buffer[INFLATE_CHUNK];
    int ret = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef *>(buffer);
        stream.avail_out = sizeof(buffer);
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            output.clear();
            return -1;
        }
        output.append(buffer, sizeof(buffer) - stream.avail_out);
        // truncated input: inflate makes no progress and never sees the trailer
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            output.clear();
            return -1;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return 0;
}

bool Compression::looksGzipped(std::string_view input)
{
    return input.size() >= 2 && static_cast<unsigned char>(input[0]) == 0x1f && static_cast<unsigned char>(input[1]) == 0x8b;
}
