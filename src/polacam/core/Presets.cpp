#include "polacam/core/Presets.hpp"

#include <algorithm>
#include <cctype>

namespace polacam {

namespace {

bool ieq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

EffectParameters makeEffect(double fw, double fh, int cornerStep) {
    EffectParameters p{};
    p.resizeScale = {fw, fh};
    p.geometry.cornerStep = cornerStep;
    return p;
}

} // namespace

const std::vector<Preset>& builtinPresets() {
    static const std::vector<Preset> presets = {
        {"modern",   "85% x 65% photo, faceted corners",  makeEffect(0.85, 0.65, 6)},
        {"compact",  "65% x 45% photo, smooth corners",   makeEffect(0.65, 0.45, 1)},
        {"portrait", "65% x 100% photo, smooth corners",  makeEffect(0.65, 1.00, 1)},
    };
    return presets;
}

std::optional<EffectParameters> presetByName(const std::string& name) {
    const auto& all = builtinPresets();
    auto it = std::find_if(all.begin(), all.end(),
                           [&name](const Preset& p) { return ieq(p.name, name); });
    if (it == all.end()) return std::nullopt;
    return it->effect;
}

const std::string& defaultPresetName() {
    return builtinPresets().front().name;
}

} // namespace polacam
