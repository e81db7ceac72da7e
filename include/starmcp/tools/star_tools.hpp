#pragma once
#include "starmcp/tools/manager.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace starmcp::tools
{

/// Spectral class and colour from surface temperature in kelvin.
struct SpectralClass
{
    std::string letter; // "O" .. "M"
    std::string color;
};

SpectralClass spectral_class_for(double temperature);

/// Luminosity class from luminosity in solar units.
std::string luminosity_class_for(double luminosity);

/// Text produced by classify_star. Throws ValidationError for zero inputs.
std::string classify_star_text(double temperature, double luminosity);

/// Text produced by get_star_info; unknown names list the known stars.
std::string star_info_text(const std::string& star_name);

/// Picks an index in [0, n).
using MoodPicker = std::function<size_t(size_t)>;

/// Registers get_star_info, classify_star and get_mood. An empty picker uses a
/// random generator.
void register_star_tools(ToolManager& tools, MoodPicker picker = {});

} // namespace starmcp::tools
