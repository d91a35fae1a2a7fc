#pragma once

#include <memory>
#include <optional>
#include <string>

#include "Bitmap.hpp"
#include "Config.hpp"

namespace polacam {

/*
  Backend interface for the pixel-heavy stages.

  Implementations should provide:
    - toneAdjust(): the per-pixel tone stage, in place, same result as
      polacam::adjustTone() regardless of how the work is split.
    - resize(): bilinear resampling into a new bitmap of the given size.
*/
class IBackend {
public:
    virtual ~IBackend() = default;

    virtual void toneAdjust(Bitmap& bmp, double intensity) = 0;

    [[nodiscard]] virtual Bitmap resize(const Bitmap& src, Size target) = 0;
};

/* Factory function for creating a backend of the requested type. */
std::unique_ptr<IBackend> makeBackend(BackendType type, std::size_t workerThreads = 0);

/* "cpu" (case-insensitive). Empty optional if unknown. */
std::optional<BackendType> backendTypeFromName(const std::string& name);

} // namespace polacam
