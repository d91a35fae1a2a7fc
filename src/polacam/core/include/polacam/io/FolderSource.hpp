#pragma once

#include "polacam/io/Capture.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace polacam {

/**
 * Capture source that replays the image files of one folder.
 *
 * Files are picked by extension (case-insensitive, without the dot;
 * empty list = every regular file) and returned in sorted path order.
 * A file that cannot be read is reported on stderr and skipped.
 */
class FolderSource final : public ICaptureSource {
public:
    FolderSource(const std::filesystem::path& folder,
                 std::vector<std::string> exts = {"jpg", "jpeg", "png", "bmp", "tif", "tiff"});

    std::optional<Capture> next() override;

    [[nodiscard]] std::size_t size() const noexcept { return files_.size(); }
    [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

private:
    std::vector<std::filesystem::path> files_;
    std::size_t cursor_{0};
};

/* Read a whole file. Empty optional if it cannot be opened or read. */
std::optional<std::vector<std::uint8_t>> readFileBytes(const std::filesystem::path& p);

} // namespace polacam
