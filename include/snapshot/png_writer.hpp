#pragma once
#include <cstdint>
#include <vector>

namespace web_archiver {

// Solid-colour RGB PNG, used as the placeholder thumbnail.
std::vector<uint8_t> encode_solid_png(uint32_t width, uint32_t height, uint8_t r, uint8_t g, uint8_t b);

} // namespace web_archiver
