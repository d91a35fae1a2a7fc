#include "modes.hpp"
#include "utils.hpp"

#include "polacam/core/Presets.hpp"

#include <iostream>

int run_presets(int /*argc*/, char** /*argv*/) {
    const auto& def = polacam::defaultPresetName();
    for (const auto& p : polacam::builtinPresets()) {
        std::cout << p.name << (p.name == def ? " (default)" : "") << " - " << p.description << "\n    ";
        printEffect(std::cout, p.effect);
        std::cout << "\n";
    }
    return 0;
}
