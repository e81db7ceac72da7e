#include "starmcp/tools/star_tools.hpp"

#include "starmcp/content.hpp"
#include "starmcp/exceptions.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>

namespace starmcp::tools
{

namespace
{

constexpr double SUN_TEMPERATURE_K = 5778.0;

struct StarRecord
{
    const char* name;
    const char* type;
    const char* temperature;
    const char* luminosity;
    const char* description;
};

constexpr std::array<StarRecord, 4> STAR_DATABASE = {{
    {"Sun", "G-type main-sequence star", "5778K", "1x solar luminosity",
     "The star at the centre of our solar system, a typical yellow dwarf"},
    {"Sirius", "A-type main-sequence star", "9940K", "25x solar luminosity",
     "The brightest star in the night sky, a binary system"},
    {"Betelgeuse", "M-type supergiant", "3500K", "100000x solar luminosity",
     "The red supergiant in Orion, one of the largest known stars"},
    {"Vega", "A-type main-sequence star", "9602K", "40x solar luminosity",
     "The brightest star in Lyra and a former pole star"},
}};

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Whole numbers print without a fractional part.
std::string format_number(double v)
{
    std::ostringstream oss;
    if (std::floor(v) == v && std::fabs(v) < 1e15)
        oss << static_cast<long long>(v);
    else
        oss << v;
    return oss.str();
}

std::string format_ratio(double v)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

std::optional<double> number_arg(const Json& args, const char* key)
{
    if (!args.is_object())
        return std::nullopt;
    auto it = args.find(key);
    if (it == args.end() || !it->is_number())
        return std::nullopt;
    return it->get<double>();
}

size_t random_pick(size_t n)
{
    static std::mutex m;
    static std::mt19937 gen{std::random_device{}()};
    std::lock_guard<std::mutex> lock(m);
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(gen);
}

} // namespace

SpectralClass spectral_class_for(double temperature)
{
    if (temperature >= 30000)
        return {"O", "blue"};
    if (temperature >= 10000)
        return {"B", "blue-white"};
    if (temperature >= 7500)
        return {"A", "white"};
    if (temperature >= 6000)
        return {"F", "yellow-white"};
    if (temperature >= 5200)
        return {"G", "yellow"};
    if (temperature >= 3700)
        return {"K", "orange"};
    return {"M", "red"};
}

std::string luminosity_class_for(double luminosity)
{
    if (luminosity >= 10000)
        return "supergiant";
    if (luminosity >= 1000)
        return "bright giant";
    if (luminosity >= 100)
        return "giant";
    if (luminosity >= 0.1)
        return "main-sequence star";
    return "white dwarf";
}

std::string classify_star_text(double temperature, double luminosity)
{
    if (temperature == 0 || luminosity == 0)
        throw ValidationError("division by zero: temperature and luminosity must be non-zero");

    auto spectral = spectral_class_for(temperature);
    std::ostringstream out;
    out << "Star classification:\n";
    out << "Temperature: " << format_number(temperature) << "K\n";
    out << "Luminosity: " << format_number(luminosity) << "x solar luminosity\n";
    out << "Spectral class: " << spectral.letter << "-type\n";
    out << "Color: " << spectral.color << "\n";
    out << "Type: " << luminosity_class_for(luminosity) << "\n";

    if (temperature > SUN_TEMPERATURE_K)
        out << "\nHotter than the Sun (" << format_ratio(temperature / SUN_TEMPERATURE_K) << "x)";
    else
        out << "\nCooler than the Sun (" << format_ratio(SUN_TEMPERATURE_K / temperature) << "x)";

    if (luminosity > 1)
        out << "\nBrighter than the Sun (" << format_ratio(luminosity) << "x)";
    else
        out << "\nDimmer than the Sun (" << format_ratio(1 / luminosity) << "x)";

    return out.str();
}

std::string star_info_text(const std::string& star_name)
{
    const std::string key = lower(star_name);
    for (const auto& star : STAR_DATABASE)
    {
        if (lower(star.name) != key)
            continue;
        std::ostringstream out;
        out << "Star: " << star.name << "\n";
        out << "Type: " << star.type << "\n";
        out << "Temperature: " << star.temperature << "\n";
        out << "Luminosity: " << star.luminosity << "\n";
        out << "Description: " << star.description;
        return out.str();
    }

    std::ostringstream out;
    out << "Sorry, no information about '" << star_name << "' in the database.\n";
    out << "Available stars: ";
    for (size_t i = 0; i < STAR_DATABASE.size(); ++i)
        out << (i ? ", " : "") << STAR_DATABASE[i].name;
    return out.str();
}

void register_star_tools(ToolManager& tools, MoodPicker picker)
{
    if (!picker)
        picker = random_pick;

    tools.register_tool(Tool(
        "get_star_info", "Look up classification details for a well-known star",
        Json{{"type", "object"},
             {"properties",
              {{"star_name", {{"type", "string"}, {"description", "Star name or type"}}}}},
             {"required", Json::array({"star_name"})}},
        [](const Json& args)
        {
            std::string name = args.is_object() ? args.value("star_name", std::string()) : "";
            return text_content(star_info_text(name));
        }));

    tools.register_tool(Tool(
        "classify_star", "Classify a star from its temperature and luminosity",
        Json{{"type", "object"},
             {"properties",
              {{"temperature",
                {{"type", "number"}, {"description", "Surface temperature (K)"}}},
               {"luminosity",
                {{"type", "number"}, {"description", "Luminosity (multiples of the Sun)"}}}}},
             {"required", Json::array({"temperature", "luminosity"})}},
        [](const Json& args)
        {
            auto temperature = number_arg(args, "temperature");
            auto luminosity = number_arg(args, "luminosity");
            if (!temperature || !luminosity)
                return text_content("Error: temperature and luminosity are required");
            // Zero inputs throw and surface as a JSON-RPC error.
            return text_content(classify_star_text(*temperature, *luminosity));
        }));

    tools.register_tool(Tool(
        "get_mood", "Report the current mood",
        Json{{"type", "object"},
             {"properties",
              {{"name", {{"type", "string"}, {"description", "Who is asking about the mood"}}}}},
             {"required", Json::array()}},
        [picker](const Json& args)
        {
            std::string name = "World";
            if (args.is_object() && args.contains("name") && args["name"].is_string())
                name = args["name"].get<std::string>();

            const std::array<std::string, 6> moods = {
                name + " is in a great mood today!",
                name + " feels a little tired today...",
                name + " is full of energy today!",
                name + " feels calm today",
                name + " is a bit excited today!",
                name + " is pondering life today...",
            };
            size_t idx = picker(moods.size()) % moods.size();
            return text_content(moods[idx]);
        }));
}

} // namespace starmcp::tools
