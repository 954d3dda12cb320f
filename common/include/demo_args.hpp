#ifndef ALGO_TRICK_DEMO_ARGS_HPP
#define ALGO_TRICK_DEMO_ARGS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace AlgoTrick {

// Parses a whole command-line argument as an int.
// Throws std::invalid_argument when anything follows the number ("3x", "1e3"),
// and whatever std::stoi throws for no number or overflow.
inline int parseDemoInt(const std::string& arg)
{
    std::size_t pos = 0;
    int value = std::stoi(arg, &pos);
    if (pos != arg.size()) {
        throw std::invalid_argument("'" + arg + "' is not an integer");
    }
    return value;
}

} // namespace AlgoTrick

#endif // ALGO_TRICK_DEMO_ARGS_HPP
