#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tissueseg {

enum class PixelType : uint8_t {
    U8  = 1,
    U16 = 2,
    S16 = 3,
};

// Raster as it comes out of a file loader, before reduction to 8 bits.
struct Image {
    int width = 0;
    int height = 0;
    int channels = 1;         // grayscale only
    int bits_stored = 0;      // 8/12/16
    int bits_allocated = 0;   // 8/16
    bool is_signed = false;
    PixelType type = PixelType::U8;
    std::vector<int32_t> pixels; // unified buffer

    size_t size() const { return pixels.size(); }
    bool empty() const { return pixels.empty(); }
};

// 8-bit single channel intensity grid, row-major.
struct GrayImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    GrayImage() = default;
    GrayImage(int w, int h, uint8_t fill = 0)
        : width(w), height(h),
          pixels(static_cast<size_t>(w > 0 ? w : 0) * static_cast<size_t>(h > 0 ? h : 0), fill) {}

    size_t size() const { return pixels.size(); }
    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }

    uint8_t at(int y, int x) const { return pixels[static_cast<size_t>(y) * width + x]; }
    uint8_t& at(int y, int x) { return pixels[static_cast<size_t>(y) * width + x]; }
};

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;

    bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

inline constexpr Rgba kTransparent{0, 0, 0, 0};
inline constexpr Rgba kOpaqueBlack{0, 0, 0, 255};

// 4 x 8-bit RGBA, row-major, interleaved. Zero-initialised (fully transparent).
struct RgbaImage {
    static constexpr int kChannels = 4;

    int width = 0;
    int height = 0;
    std::vector<uint8_t> data;

    RgbaImage() = default;
    RgbaImage(int w, int h)
        : width(w), height(h),
          data(static_cast<size_t>(w > 0 ? w : 0) * static_cast<size_t>(h > 0 ? h : 0) * kChannels, 0) {}

    bool empty() const { return width <= 0 || height <= 0 || data.empty(); }
    size_t pixel_count() const { return static_cast<size_t>(width) * static_cast<size_t>(height); }
    size_t stride() const { return static_cast<size_t>(width) * kChannels; }

    Rgba at(int y, int x) const {
        const uint8_t* p = data.data() + offset(y, x);
        return Rgba{p[0], p[1], p[2], p[3]};
    }
    void set(int y, int x, const Rgba& c) {
        uint8_t* p = data.data() + offset(y, x);
        p[0] = c.r;
        p[1] = c.g;
        p[2] = c.b;
        p[3] = c.a;
    }

private:
    size_t offset(int y, int x) const {
        return (static_cast<size_t>(y) * width + x) * kChannels;
    }
};

} // namespace tissueseg
