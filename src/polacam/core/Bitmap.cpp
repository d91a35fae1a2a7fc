#include "polacam/core/Bitmap.hpp"

#include <stdexcept>

namespace polacam {

Bitmap::Bitmap(int width, int height, Pixel fill)
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Bitmap: width and height must be positive");
    }
    width_  = width;
    height_ = height;
    pixels_.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kChannels);
    this->fill(fill);
}

void Bitmap::fill(Pixel px) noexcept {
    for (std::size_t i = 0; i + 2 < pixels_.size(); i += kChannels) {
        pixels_[i]     = px.r;
        pixels_[i + 1] = px.g;
        pixels_[i + 2] = px.b;
    }
}

} // namespace polacam
