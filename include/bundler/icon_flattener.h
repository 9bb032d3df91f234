#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace bundler {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  bool operator==(const Rgb &other) const {
    return r == other.r && g == other.g && b == other.b;
  }
};

// Tightly packed RGBA8 pixels, row major.
struct RgbaImage {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::vector<std::uint8_t> pixels;
};

RgbaImage LoadPng(const std::filesystem::path &path);
void SavePng(const std::filesystem::path &path, const RgbaImage &image);

// Walks column x from start_y in direction step (+1 down, -1 up) and returns
// the first visible pixel that is not near-white.
std::optional<Rgb> FindBackgroundColor(const RgbaImage &image, std::size_t x,
                                       std::size_t start_y, int step);

Rgb GradientColor(Rgb top, Rgb bottom, std::size_t y, std::size_t height);

// Composites every pixel over a vertical gradient sampled from the top and
// bottom edges at the horizontal centre. The result is fully opaque.
RgbaImage FlattenAlpha(const RgbaImage &image);

void FlattenIconFile(const std::filesystem::path &input,
                     const std::filesystem::path &output);

} // namespace bundler
