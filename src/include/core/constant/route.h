#pragma once

#include <string_view>

namespace wledbackup::core {

class ApiRoute {
public:
    static constexpr std::string_view kConfig = "/cfg.json";
    static constexpr std::string_view kPresets = "/presets.json";
};

} // namespace wledbackup::core
