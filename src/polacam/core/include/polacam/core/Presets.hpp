#pragma once

#include "polacam/core/Config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace polacam {

/* A named set of effect parameters. */
struct Preset {
    std::string      name;
    std::string      description;
    EffectParameters effect;
};

/* All built-in presets, default first. */
const std::vector<Preset>& builtinPresets();

/* Case-insensitive lookup. Empty optional if the name is unknown. */
std::optional<EffectParameters> presetByName(const std::string& name);

/* Name of the preset used when none is requested. */
const std::string& defaultPresetName();

} // namespace polacam
