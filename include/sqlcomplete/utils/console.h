#pragma once

#include <string_view>

namespace console {
/// Log a text to the console
void log(std::string_view text);
}  // namespace console
