#include "polacam/io/DirectorySink.hpp"
#include "polacam/core/Errors.hpp"

#include <zlib.h>

#include <fstream>
#include <system_error>

namespace polacam {

std::uint32_t crc32Of(std::span<const std::uint8_t> bytes) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uInt>(bytes.size()));
    return static_cast<std::uint32_t>(crc);
}

DirectorySink::DirectorySink(const std::filesystem::path& dir)
    : dir_(dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec || !std::filesystem::is_directory(dir_)) {
        throw Error("DirectorySink: cannot create directory '" + dir_.string() + "'"
                    + (ec ? ": " + ec.message() : std::string{}));
    }
}

SaveReceipt DirectorySink::save(const std::string& name, std::span<const std::uint8_t> bytes)
{
    const std::filesystem::path file = std::filesystem::path(name).filename();
    if (file.empty()) {
        throw Error("DirectorySink: empty file name");
    }
    const std::filesystem::path target = dir_ / file;

    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw Error("DirectorySink: cannot open '" + target.string() + "' for writing");
    }
    if (!bytes.empty()) {
        ofs.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }
    ofs.close();
    if (!ofs) {
        throw Error("DirectorySink: failed to write '" + target.string() + "'");
    }

    return SaveReceipt{target.string(), bytes.size(), crc32Of(bytes)};
}

} // namespace polacam
