#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the subcommand.
      Example:   polacam-cli process --in=shot.jpg --intensity=0.5
    - Keys are case-sensitive.

  Numeric getters return an empty optional when the key is missing and
  throw std::invalid_argument (naming the key) when the value does not parse,
  so a typo never silently falls back to a default.
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

/* Check presence of "--key=..." (any value). */
inline bool argGiven(int argc, char** argv, const std::string& key) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) if (std::string(argv[i]).rfind(pref, 0) == 0) return true;
    return false;
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}

/* Strict integer parse of the value of option 'key'; the whole string must parse. */
inline int parseInt(const std::string& key, const std::string& v) {
    try {
        std::size_t pos = 0;
        const int out = std::stoi(v, &pos);
        if (pos == v.size()) return out;
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw std::invalid_argument("--" + key + ": not an integer: '" + v + "'");
}

/* Strict floating parse of the value of option 'key'. */
inline double parseDouble(const std::string& key, const std::string& v) {
    try {
        std::size_t pos = 0;
        const double out = std::stod(v, &pos);
        if (pos == v.size()) return out;
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw std::invalid_argument("--" + key + ": not a number: '" + v + "'");
}

/* Integer value for "--key=value". */
inline std::optional<int> argInt(int argc, char** argv, const std::string& key) {
    if (!argGiven(argc, argv, key)) return std::nullopt;
    return parseInt(key, argValue(argc, argv, key));
}

/* Floating value for "--key=value". */
inline std::optional<double> argDouble(int argc, char** argv, const std::string& key) {
    if (!argGiven(argc, argv, key)) return std::nullopt;
    return parseDouble(key, argValue(argc, argv, key));
}

/* Split "AxB" into two strings. Throws if there is no 'x'. */
inline std::pair<std::string, std::string> splitPair(const std::string& key, const std::string& v) {
    const auto xPos = v.find('x');
    if (xPos == std::string::npos || xPos == 0 || xPos + 1 >= v.size()) {
        throw std::invalid_argument("--" + key + ": expected AxB, got '" + v + "'");
    }
    return {v.substr(0, xPos), v.substr(xPos + 1)};
}
