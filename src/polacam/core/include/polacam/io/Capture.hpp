#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace polacam {

/// One encoded capture as handed over by a camera (or a stand-in for it).
struct Capture {
    std::vector<std::uint8_t> bytes;  ///< encoded image (JPEG, PNG, ...)
    std::string id;                   ///< file name / path the capture is known by
};

/// Where captures come from. next() returns an empty optional when exhausted.
class ICaptureSource {
public:
    virtual ~ICaptureSource() = default;

    [[nodiscard]] virtual std::optional<Capture> next() = 0;
};

/// What a persistence sink reports back for one saved file.
struct SaveReceipt {
    std::string   path;
    std::size_t   bytes{0};
    std::uint32_t crc32{0};  ///< zlib CRC-32 of the written bytes
};

/// Where finished photos go. save() throws polacam::Error on failure.
class IPersistenceSink {
public:
    virtual ~IPersistenceSink() = default;

    virtual SaveReceipt save(const std::string& name, std::span<const std::uint8_t> bytes) = 0;
};

} // namespace polacam
