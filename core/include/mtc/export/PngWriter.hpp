#pragma once
#include "mtc/render/Image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

// 8-bit RGB PNG (alpha dropped) with stored deflate blocks; no zlib.
// Rows are taken top-down unless flipRows is set (GL readback order).
std::vector<std::uint8_t> encodePNG(const std::uint8_t* rgba, int width, int height,
                                    bool flipRows = false);
std::vector<std::uint8_t> encodePNG(const Image& img);

bool writePNG(const std::string& path, const Image& img);
bool writeBytes(const std::string& path, const std::vector<std::uint8_t>& bytes);

} // namespace mtc
