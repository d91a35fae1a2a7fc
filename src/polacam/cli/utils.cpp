#include "utils.hpp"
#include "args.hpp"

#include "polacam/compose/PolaroidFrame.hpp"
#include "polacam/core/Backend.hpp"
#include "polacam/core/Presets.hpp"
#include "polacam/io/DirectorySink.hpp"

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

constexpr double kMaxScale = 64.0;

/* Apply --key=N to 'field' if given. */
void overrideInt(int argc, char** argv, const char* key, int& field) {
    if (auto v = argInt(argc, argv, key)) field = *v;
}

} // namespace

polacam::Pipeline::Options pipelineOptionsFromArgs(int argc, char** argv)
{
    polacam::Pipeline::Options o{};

    const std::string preset = argValue(argc, argv, "preset", polacam::defaultPresetName());
    auto fx = polacam::presetByName(preset);
    if (!fx) {
        throw std::invalid_argument("--preset: unknown preset '" + preset + "' (see 'presets')");
    }
    o.effect = *fx;

    if (auto v = argDouble(argc, argv, "intensity")) o.effect.intensity = *v;

    if (argGiven(argc, argv, "scale")) {
        auto [w, h] = splitPair("scale", argValue(argc, argv, "scale"));
        o.effect.resizeScale.width  = parseDouble("scale", w);
        o.effect.resizeScale.height = parseDouble("scale", h);
        for (double f : {o.effect.resizeScale.width, o.effect.resizeScale.height}) {
            if (!std::isfinite(f) || f <= 0.0 || f > kMaxScale) {
                throw std::invalid_argument("--scale: factors must be in (0, 64]");
            }
        }
    }

    auto& g = o.effect.geometry;
    overrideInt(argc, argv, "top",     g.topBorder);
    overrideInt(argc, argv, "side",    g.sideBorder);
    overrideInt(argc, argv, "bottom",  g.bottomBorder);
    overrideInt(argc, argv, "radius",  g.cornerRadius);
    overrideInt(argc, argv, "margin",  g.outerMargin);
    overrideInt(argc, argv, "shadow",  g.shadowSize);
    overrideInt(argc, argv, "outline", g.borderThickness);
    overrideInt(argc, argv, "step",    g.cornerStep);
    if (argHas(argc, argv, "shadow-over-photo")) g.shadowOverPhoto = true;

    polacam::validateGeometry(g);

    overrideInt(argc, argv, "quality", o.jpegQuality);
    o.outputSuffix = argValue(argc, argv, "suffix", o.outputSuffix);
    return o;
}

polacam::Config configFromArgs(int argc, char** argv)
{
    polacam::Config c{};
    const std::string name = argValue(argc, argv, "backend", "cpu");
    auto type = polacam::backendTypeFromName(name);
    if (!type) throw std::invalid_argument("--backend: unknown backend '" + name + "' (only 'cpu')");
    c.backend = *type;

    if (auto t = argInt(argc, argv, "threads")) {
        if (*t < 0) throw std::invalid_argument("--threads: must not be negative");
        c.workerThreads = static_cast<std::size_t>(*t);
    }
    return c;
}

polacam::Pixel parseColor(const std::string& key, const std::string& v)
{
    std::stringstream ss(v);
    std::string part;
    int c[3] = {0, 0, 0};
    int n = 0;
    while (std::getline(ss, part, ',')) {
        if (n >= 3) throw std::invalid_argument("--" + key + ": expected r,g,b, got '" + v + "'");
        c[n] = parseInt(key, part);
        if (c[n] < 0 || c[n] > 255) {
            throw std::invalid_argument("--" + key + ": component out of [0..255] in '" + v + "'");
        }
        ++n;
    }
    if (n != 3) throw std::invalid_argument("--" + key + ": expected r,g,b, got '" + v + "'");

    return {static_cast<std::uint8_t>(c[0]),
            static_cast<std::uint8_t>(c[1]),
            static_cast<std::uint8_t>(c[2])};
}

void printEffect(std::ostream& os, const polacam::EffectParameters& fx)
{
    const auto& g = fx.geometry;
    os << "intensity=" << fx.intensity
       << " scale=" << fx.resizeScale.width << "x" << fx.resizeScale.height
       << " top=" << g.topBorder << " side=" << g.sideBorder << " bottom=" << g.bottomBorder
       << " radius=" << g.cornerRadius << " margin=" << g.outerMargin
       << " shadow=" << g.shadowSize << " outline=" << g.borderThickness
       << " step=" << g.cornerStep;
}

bool write_output_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
{
    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (ofs) {
        ofs.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }
    ofs.close();
    if (!ofs) {
        std::cerr << "[save] failed to save " << path.string() << "\n";
        return false;
    }
    std::cout << "[save] " << path.string() << " (" << bytes.size()
              << " bytes, crc32=" << std::hex << polacam::crc32Of(bytes) << std::dec << ")\n";
    return true;
}
