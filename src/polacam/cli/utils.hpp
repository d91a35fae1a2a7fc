#pragma once
#include "polacam/core/Config.hpp"
#include "polacam/core/Pipeline.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>

/*
  Helpers shared by the CLI modes: turning argv into configuration and
  writing results. Parsing helpers throw std::invalid_argument with a
  message naming the offending option.
*/

/* Pipeline options from --preset plus individual overrides:
   --intensity --scale=WxH --top --side --bottom --radius --margin
   --shadow --outline --step --quality --suffix --shadow-over-photo */
polacam::Pipeline::Options pipelineOptionsFromArgs(int argc, char** argv);

/* Backend selection: --backend=cpu --threads=N */
polacam::Config configFromArgs(int argc, char** argv);

/* "r,g,b" with every component in [0..255]. */
polacam::Pixel parseColor(const std::string& key, const std::string& v);

/* One-line summary of the effect constants, for logs. */
void printEffect(std::ostream& os, const polacam::EffectParameters& fx);

/* Write bytes to 'path' (parent folders are created).
   Prints a short message on success or failure. */
bool write_output_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
