#include <bundler/icon_flattener.h>

#include <bundler/errors.h>

#include <cstring>
#include <stdexcept>
#include <string>

#include <png.h>

namespace bundler {
namespace {

constexpr std::uint8_t kNearWhite = 240;

bool IsNearWhite(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
  return r > kNearWhite && g > kNearWhite && b > kNearWhite;
}

std::uint8_t Blend(std::uint8_t foreground, std::uint8_t background,
                   std::uint8_t alpha) {
  const unsigned a = alpha;
  const unsigned inverse = 255U - a;
  return static_cast<std::uint8_t>(
      (foreground * a + background * inverse + 127U) / 255U);
}

} // namespace

RgbaImage LoadPng(const std::filesystem::path &path) {
  png_image png;
  std::memset(&png, 0, sizeof(png));
  png.version = PNG_IMAGE_VERSION;

  if (png_image_begin_read_from_file(&png, path.c_str()) == 0) {
    throw std::runtime_error("Failed to read PNG " + path.string() + ": " +
                             png.message);
  }
  png.format = PNG_FORMAT_RGBA;

  RgbaImage image;
  image.width = png.width;
  image.height = png.height;
  image.pixels.resize(PNG_IMAGE_SIZE(png));
  if (png_image_finish_read(&png, nullptr, image.pixels.data(), 0, nullptr) ==
      0) {
    const std::string message = png.message;
    png_image_free(&png);
    throw std::runtime_error("Failed to decode PNG " + path.string() + ": " +
                             message);
  }
  return image;
}

void SavePng(const std::filesystem::path &path, const RgbaImage &image) {
  if (image.pixels.size() !=
      static_cast<std::size_t>(image.width) * image.height * 4) {
    throw std::invalid_argument("RGBA buffer does not match image size");
  }
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  png_image png;
  std::memset(&png, 0, sizeof(png));
  png.version = PNG_IMAGE_VERSION;
  png.width = image.width;
  png.height = image.height;
  png.format = PNG_FORMAT_RGBA;

  if (png_image_write_to_file(&png, path.c_str(), 0, image.pixels.data(), 0,
                              nullptr) == 0) {
    const std::string message = png.message;
    png_image_free(&png);
    throw FilesystemError("write PNG (" + message + ")", path);
  }
}

std::optional<Rgb> FindBackgroundColor(const RgbaImage &image, std::size_t x,
                                       std::size_t start_y, int step) {
  if (x >= image.width) {
    return std::nullopt;
  }
  for (auto y = static_cast<long long>(start_y);
       y >= 0 && y < static_cast<long long>(image.height); y += step) {
    const auto index =
        (static_cast<std::size_t>(y) * image.width + x) * 4;
    const auto r = image.pixels[index];
    const auto g = image.pixels[index + 1];
    const auto b = image.pixels[index + 2];
    const auto a = image.pixels[index + 3];
    if (a > 0 && !IsNearWhite(r, g, b)) {
      return Rgb{r, g, b};
    }
  }
  return std::nullopt;
}

Rgb GradientColor(Rgb top, Rgb bottom, std::size_t y, std::size_t height) {
  if (height <= 1) {
    return top;
  }
  const auto denominator = static_cast<std::uint32_t>(height - 1);
  const auto weight = static_cast<std::uint32_t>(y);
  const auto inverse = denominator - weight;
  const auto lerp = [&](std::uint8_t from, std::uint8_t to) {
    const std::uint32_t value = from * inverse + to * weight;
    return static_cast<std::uint8_t>((value + denominator / 2) / denominator);
  };
  return Rgb{lerp(top.r, bottom.r), lerp(top.g, bottom.g),
             lerp(top.b, bottom.b)};
}

RgbaImage FlattenAlpha(const RgbaImage &image) {
  if (image.width == 0 || image.height == 0) {
    throw std::runtime_error("Cannot flatten an empty image");
  }
  const std::size_t center = image.width / 2;
  const auto top = FindBackgroundColor(image, center, 0, 1);
  const auto bottom =
      FindBackgroundColor(image, center, image.height - 1, -1);
  if (!top || !bottom) {
    throw std::runtime_error("Could not find suitable background color");
  }

  RgbaImage flattened;
  flattened.width = image.width;
  flattened.height = image.height;
  flattened.pixels.resize(image.pixels.size());
  for (std::size_t y = 0; y < image.height; ++y) {
    const auto background = GradientColor(*top, *bottom, y, image.height);
    for (std::size_t x = 0; x < image.width; ++x) {
      const auto i = (y * image.width + x) * 4;
      const auto alpha = image.pixels[i + 3];
      if (alpha == 255) {
        flattened.pixels[i] = image.pixels[i];
        flattened.pixels[i + 1] = image.pixels[i + 1];
        flattened.pixels[i + 2] = image.pixels[i + 2];
      } else if (alpha == 0) {
        flattened.pixels[i] = background.r;
        flattened.pixels[i + 1] = background.g;
        flattened.pixels[i + 2] = background.b;
      } else {
        flattened.pixels[i] = Blend(image.pixels[i], background.r, alpha);
        flattened.pixels[i + 1] =
            Blend(image.pixels[i + 1], background.g, alpha);
        flattened.pixels[i + 2] =
            Blend(image.pixels[i + 2], background.b, alpha);
      }
      flattened.pixels[i + 3] = 255;
    }
  }
  return flattened;
}

void FlattenIconFile(const std::filesystem::path &input,
                     const std::filesystem::path &output) {
  SavePng(output, FlattenAlpha(LoadPng(input)));
}

} // namespace bundler
