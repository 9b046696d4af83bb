#include "snapshot/png_writer.hpp"
#include <zlib.h>
#include <stdexcept>
#include <string>

namespace web_archiver {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void write_chunk(std::vector<uint8_t>& out, const char* type, const uint8_t* data, size_t len) {
    put_u32(out, static_cast<uint32_t>(len));
    size_t type_pos = out.size();
    out.insert(out.end(), type, type + 4);
    if (len > 0) out.insert(out.end(), data, data + len);

    // CRC covers type and data
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, out.data() + type_pos, static_cast<uInt>(4 + len));
    put_u32(out, static_cast<uint32_t>(crc));
}

} // namespace

std::vector<uint8_t> encode_solid_png(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("PNG dimensions must be non-zero");
    }

    std::vector<uint8_t> out;
    const uint8_t signature[] = {137, 80, 78, 71, 13, 10, 26, 10};
    out.insert(out.end(), signature, signature + 8);

    std::vector<uint8_t> ihdr;
    put_u32(ihdr, width);
    put_u32(ihdr, height);
    ihdr.push_back(8); // bit depth
    ihdr.push_back(2); // truecolour RGB
    ihdr.push_back(0); // deflate
    ihdr.push_back(0); // adaptive filtering
    ihdr.push_back(0); // no interlace
    write_chunk(out, "IHDR", ihdr.data(), ihdr.size());

    // Each scanline: filter byte 0 then RGB triples
    std::vector<uint8_t> raw;
    raw.reserve(static_cast<size_t>(height) * (1 + width * 3));
    for (uint32_t y = 0; y < height; ++y) {
        raw.push_back(0);
        for (uint32_t x = 0; x < width; ++x) {
            raw.push_back(r);
            raw.push_back(g);
            raw.push_back(b);
        }
    }

    uLongf compressed_size = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> compressed(compressed_size);
    int rc = compress2(compressed.data(), &compressed_size, raw.data(), static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        throw std::runtime_error("zlib compress2 failed with code " + std::to_string(rc));
    }
    compressed.resize(compressed_size);
    write_chunk(out, "IDAT", compressed.data(), compressed.size());
    write_chunk(out, "IEND", nullptr, 0);
    return out;
}

} // namespace web_archiver
