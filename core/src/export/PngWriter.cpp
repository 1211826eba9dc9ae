#include "mtc/export/PngWriter.hpp"

#include <algorithm>
#include <cstdio>
#include <initializer_list>

namespace mtc {

namespace {

const std::uint32_t* crcTable() {
  static std::uint32_t table[256];
  static bool ready = false;
  if (!ready) {
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
      table[n] = c;
    }
    ready = true;
  }
  return table;
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t len) {
  const std::uint32_t* t = crcTable();
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) c = t[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return c ^ 0xFFFFFFFFu;
}

// RFC 1950; 5552 is the largest run that cannot overflow the sums.
std::uint32_t adler32(const std::uint8_t* data, std::size_t len) {
  constexpr std::uint32_t MOD = 65521u;
  std::uint32_t a = 1, b = 0;
  while (len > 0) {
    std::size_t chunk = std::min<std::size_t>(len, 5552);
    for (std::size_t i = 0; i < chunk; i++) {
      a += data[i];
      b += a;
    }
    a %= MOD;
    b %= MOD;
    data += chunk;
    len -= chunk;
  }
  return (b << 16) | a;
}

void putBE32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

void putChunk(std::vector<std::uint8_t>& out, const char* type,
              const std::vector<std::uint8_t>& payload) {
  putBE32(out, static_cast<std::uint32_t>(payload.size()));
  std::size_t start = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), payload.begin(), payload.end());
  putBE32(out, crc32(&out[start], out.size() - start));
}

// zlib stream of stored (uncompressed) deflate blocks.
std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& raw) {
  std::vector<std::uint8_t> z;
  z.reserve(raw.size() + raw.size() / 65535 * 5 + 16);
  z.push_back(0x78);
  z.push_back(0x01);

  std::size_t off = 0;
  do {
    std::size_t n = std::min<std::size_t>(65535, raw.size() - off);
    bool last = off + n == raw.size();
    z.push_back(last ? 0x01 : 0x00);
    auto len = static_cast<std::uint16_t>(n);
    auto nlen = static_cast<std::uint16_t>(~len);
    z.push_back(static_cast<std::uint8_t>(len & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen >> 8));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(off),
             raw.begin() + static_cast<std::ptrdiff_t>(off + n));
    off += n;
  } while (off < raw.size());

  putBE32(z, adler32(raw.data(), raw.size()));
  return z;
}

} // namespace

std::vector<std::uint8_t> encodePNG(const std::uint8_t* rgba, int width, int height,
                                    bool flipRows) {
  std::vector<std::uint8_t> out;
  if (!rgba || width <= 0 || height <= 0) return out;

  // Filter byte 0 (None) then RGB per row.
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(height) * (1 + static_cast<std::size_t>(width) * 3));
  for (int row = 0; row < height; row++) {
    int sy = flipRows ? height - 1 - row : row;
    const std::uint8_t* p = rgba + static_cast<std::size_t>(sy) * width * 4;
    raw.push_back(0);
    for (int x = 0; x < width; x++, p += 4) raw.insert(raw.end(), p, p + 3);
  }

  static const std::uint8_t sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  out.insert(out.end(), sig, sig + 8);

  std::vector<std::uint8_t> ihdr;
  putBE32(ihdr, static_cast<std::uint32_t>(width));
  putBE32(ihdr, static_cast<std::uint32_t>(height));
  ihdr.insert(ihdr.end(), {8, 2, 0, 0, 0});   // depth, RGB, deflate, filter, no interlace
  putChunk(out, "IHDR", ihdr);
  putChunk(out, "IDAT", zlibStored(raw));
  putChunk(out, "IEND", {});
  return out;
}

std::vector<std::uint8_t> encodePNG(const Image& img) {
  if (img.empty()) return {};
  return encodePNG(img.rgba.data(), img.width, img.height, false);
}

bool writeBytes(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  if (bytes.empty()) return false;
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writeBytes: cannot open %s\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  std::fclose(f);
  return written == bytes.size();
}

bool writePNG(const std::string& path, const Image& img) {
  return writeBytes(path, encodePNG(img));
}

} // namespace mtc
