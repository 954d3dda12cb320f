#include <exception>
#include <string>
#include <vector>

#include <spdlog/spdlog.h> // For logging

#include "demo_args.hpp"
#include "demo_logging.hpp"
#include "fibonacci.hpp"

// Naive recursion is only run up to this index; beyond it takes seconds.
const int NAIVE_LIMIT = 35;

int main(int argc, char** argv) {
    std::vector<std::string> args = AlgoTrick::initDemoLogging(argc, argv);

    int n = 10;
    try {
        if (!args.empty()) {
            n = AlgoTrick::parseDemoInt(args[0]);
        }
    } catch (const std::exception& e) {
        spdlog::error("Usage: {} [--log-level=<level>] [n] ({})", argv[0], e.what());
        return 1;
    }

    try {
        spdlog::info("Memoized F({}) = {}", n, AlgoTrick::fibonacciMemo(n));
        spdlog::info("Iterative F({}) = {}", n, AlgoTrick::fibonacciIterative(n));
        spdlog::info("Matrix F({}) = {}", n, AlgoTrick::fibonacciMatrix(n));
        if (n <= NAIVE_LIMIT) {
            spdlog::info("Naive F({}) = {}", n, AlgoTrick::fibonacciNaive(n));
        } else {
            spdlog::debug("Skipping naive recursion for n > {}", NAIVE_LIMIT);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fibonacci failed: {}", e.what());
        return 1;
    }

    return 0;
}
