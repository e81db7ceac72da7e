#pragma once

namespace starmcp
{

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.2.0";

} // namespace starmcp
