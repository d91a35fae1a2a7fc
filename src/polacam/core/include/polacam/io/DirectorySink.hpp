#pragma once

#include "polacam/io/Capture.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace polacam {

/// zlib CRC-32 of a byte buffer.
std::uint32_t crc32Of(std::span<const std::uint8_t> bytes);

/// Persistence sink writing each photo as one file into a directory
/// (created on construction if missing). Only the file-name part of the
/// requested name is used, so callers cannot escape the directory.
class DirectorySink final : public IPersistenceSink {
public:
    explicit DirectorySink(const std::filesystem::path& dir);

    SaveReceipt save(const std::string& name, std::span<const std::uint8_t> bytes) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

private:
    std::filesystem::path dir_;
};

} // namespace polacam
