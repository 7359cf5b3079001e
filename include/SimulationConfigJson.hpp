#pragma once

#include "SimulationConfig.hpp"

#include <string>
#include <vector>

namespace scramble
{
    struct ConfigParseResult
    {
        bool ok = false;
        SimulationConfig config{};
        std::vector<std::string> errors;
    };

    std::string simulationConfigToJson(const SimulationConfig &config);

    // Missing sections and fields keep their defaults. Wrongly typed or invalid values are
    // reported in `errors` and leave `ok` false.
    ConfigParseResult simulationConfigFromJson(const std::string &json_text);

    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace scramble
