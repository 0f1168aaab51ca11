#pragma once
#include <string_view>

namespace rs::log {

enum class Level { Quiet = 0, Error, Warn, Info, Debug };

void set_level(Level l) noexcept;

// Each line goes to stderr as "[tag] msg".
void error(std::string_view tag, std::string_view msg);
void warn(std::string_view tag, std::string_view msg);
void info(std::string_view tag, std::string_view msg);
void debug(std::string_view tag, std::string_view msg);

}
