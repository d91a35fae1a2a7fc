//====================================================================
// File: core/include/polacam/core/Bitmap.hpp
//====================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace polacam {

/// Width/height pair in pixels.
struct Size {
    int width{0};
    int height{0};

    bool operator==(const Size&) const = default;
};

/// Axis-aligned rectangle, top-left corner plus extent.
struct Rect {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    bool operator==(const Rect&) const = default;
};

/// One RGB pixel, every channel in [0..255].
struct Pixel {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    bool operator==(const Pixel&) const = default;
};

/// Owning RGB24 image: one contiguous row-major buffer, channels interleaved
/// in R,G,B order. Element (x, y, c) lives at (y*width + x)*kChannels + c.
class Bitmap {
public:
    static constexpr int kChannels = 3;

    Bitmap() = default;
    Bitmap(int width, int height, Pixel fill = {});

    [[nodiscard]] int  width()  const noexcept { return width_; }
    [[nodiscard]] int  height() const noexcept { return height_; }
    [[nodiscard]] Size size()   const noexcept { return {width_, height_}; }
    [[nodiscard]] bool empty()  const noexcept { return pixels_.empty(); }

    /// Total byte size of the pixel buffer.
    [[nodiscard]] std::size_t bytes() const noexcept { return pixels_.size(); }

    [[nodiscard]] std::size_t index(int x, int y) const noexcept {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_)
                + static_cast<std::size_t>(x)) * kChannels;
    }

    [[nodiscard]] bool contains(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    [[nodiscard]] Pixel pixel(int x, int y) const noexcept {
        const std::uint8_t* p = pixels_.data() + index(x, y);
        return {p[0], p[1], p[2]};
    }

    void setPixel(int x, int y, Pixel px) noexcept {
        std::uint8_t* p = pixels_.data() + index(x, y);
        p[0] = px.r; p[1] = px.g; p[2] = px.b;
    }

    /// Fill every pixel with one color.
    void fill(Pixel px) noexcept;

    [[nodiscard]] std::uint8_t*       data()       noexcept { return pixels_.data(); }
    [[nodiscard]] const std::uint8_t* data() const noexcept { return pixels_.data(); }

    [[nodiscard]] std::uint8_t* row(int y) noexcept { return pixels_.data() + index(0, y); }
    [[nodiscard]] const std::uint8_t* row(int y) const noexcept { return pixels_.data() + index(0, y); }

    /// Read-only view of the raw buffer.
    [[nodiscard]] std::span<const std::uint8_t> span() const noexcept {
        return {pixels_.data(), pixels_.size()};
    }

private:
    int width_{0};
    int height_{0};
    std::vector<std::uint8_t> pixels_;
};

} // namespace polacam
