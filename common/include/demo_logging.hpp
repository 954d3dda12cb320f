#ifndef ALGO_TRICK_DEMO_LOGGING_HPP
#define ALGO_TRICK_DEMO_LOGGING_HPP

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace AlgoTrick {

/**
 * @brief Sets up the console logger shared by all demo executables.
 *
 * Consumes "--log-level=<level>" from the command line (trace, debug, info,
 * warn, error, critical, off) and returns the remaining positional arguments.
 * An unrecognised level falls back to info with a warning.
 *
 * @param argc Argument count from main.
 * @param argv Argument vector from main.
 * @return The arguments that were not logging options, argv[0] excluded.
 */
inline std::vector<std::string> initDemoLogging(int argc, char** argv)
{
    const std::string level_flag = "--log-level=";

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind(level_flag, 0) == 0) {
            std::string name = arg.substr(level_flag.size());
            spdlog::level::level_enum level = spdlog::level::from_str(name);
            // from_str maps unknown names to off; only honour off when asked for
            if (level == spdlog::level::off && name != "off") {
                spdlog::warn("Unknown log level '{}', keeping info.", name);
                continue;
            }
            spdlog::set_level(level);
        } else {
            positional.push_back(arg);
        }
    }
    return positional;
}

} // namespace AlgoTrick

#endif // ALGO_TRICK_DEMO_LOGGING_HPP
