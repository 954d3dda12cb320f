// main.cpp
#include "search.hpp"
#include "demo_args.hpp"
#include "demo_logging.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h> // For logging
#include <spdlog/fmt/ranges.h> // For fmt::join

int main(int argc, char** argv) {
    std::vector<std::string> args = AlgoTrick::initDemoLogging(argc, argv);

    const std::vector<int> sorted_nums = {1, 3, 5, 7, 9};
    std::vector<int> targets = {7, 4};

    if (!args.empty()) {
        targets.clear();
        try {
            for (const auto& arg : args) {
                targets.push_back(AlgoTrick::parseDemoInt(arg));
            }
        } catch (const std::exception& e) {
            spdlog::error("Usage: {} [--log-level=<level>] [target ...] ({})", argv[0], e.what());
            return 1;
        }
    }

    for (int target : targets) {
        std::size_t index = AlgoTrick::binarySearch(sorted_nums, target);
        if (index == AlgoTrick::kNotFound) {
            spdlog::info("Binary search for {}: not found", target);
        } else {
            spdlog::info("Binary search for {}: index {}", target, index);
        }
    }

    AlgoTrick::BinarySearchTree<int> tree;
    for (int val : {50, 30, 70, 20, 40, 60, 80}) {
        tree.insert(val);
    }
    spdlog::info("BST holds {} values, in-order: {}", tree.size(),
                 fmt::join(tree.inorder(), " "));

    for (int target : targets) {
        spdlog::info("BST contains {}: {}", target, tree.contains(target));
    }

    return 0;
}
