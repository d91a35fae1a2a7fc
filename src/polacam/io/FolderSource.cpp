#include "polacam/io/FolderSource.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>

namespace polacam {

// ---------------- helpers ----------------

static bool ieq(const std::string& a, const std::string& b) {
    if (a.size()!=b.size()) return false;
    for (size_t i=0;i<a.size();++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

static std::string ext_of(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0]=='.') e.erase(0,1);
    return e;
}

static std::vector<std::filesystem::path>
list_images_in_folder(const std::filesystem::path& folder,
                      const std::vector<std::string>& allow_exts)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) return files;

    for (auto& de : std::filesystem::directory_iterator(folder, ec)) {
        if (!de.is_regular_file()) continue;
        if (allow_exts.empty()) {
            files.push_back(de.path());
            continue;
        }
        const auto e = ext_of(de.path());
        for (auto& a: allow_exts) {
            if (ieq(e, a)) { files.push_back(de.path()); break; }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::optional<std::vector<std::uint8_t>> readFileBytes(const std::filesystem::path& p)
{
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) return std::nullopt;

    std::vector<std::uint8_t> out((std::istreambuf_iterator<char>(ifs)),
                                  std::istreambuf_iterator<char>());
    if (ifs.bad()) return std::nullopt;
    return out;
}

// ---------------- FolderSource ----------------

FolderSource::FolderSource(const std::filesystem::path& folder,
                           std::vector<std::string> exts)
    : files_(list_images_in_folder(folder, exts))
{}

std::optional<Capture> FolderSource::next()
{
    while (cursor_ < files_.size()) {
        const auto& p = files_[cursor_++];
        auto bytes = readFileBytes(p);
        if (!bytes) {
            std::cerr << "[source] failed to read '" << p.string() << "' - skipping\n";
            continue;
        }
        return Capture{std::move(*bytes), p.filename().string()};
    }
    return std::nullopt;
}

} // namespace polacam
