// main.cpp
#include "sort.hpp"
#include "demo_args.hpp"
#include "demo_logging.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h> // For logging

std::string formatVector(const std::vector<int>& arr) {
    std::ostringstream oss;
    for (int val : arr) {
        oss << val << " ";
    }
    return oss.str();
}

int main(int argc, char** argv) {
    std::vector<std::string> args = AlgoTrick::initDemoLogging(argc, argv);

    std::vector<int> nums = {5, 2, 9, 1, 5, 6};
    if (!args.empty()) {
        nums.clear();
        try {
            for (const auto& arg : args) {
                nums.push_back(AlgoTrick::parseDemoInt(arg));
            }
        } catch (const std::exception& e) {
            spdlog::error("Usage: {} [--log-level=<level>] [int ...] ({})", argv[0], e.what());
            return 1;
        }
    }

    spdlog::info("Original array: {}", formatVector(nums));

    // Both sorts return a new vector; nums stays as given
    std::vector<int> merge_nums = AlgoTrick::mergeSort(nums);
    spdlog::info("Merge Sorted: {}", formatVector(merge_nums));

    std::vector<int> quick_nums = AlgoTrick::quickSort(nums);
    spdlog::info("Quick Sorted: {}", formatVector(quick_nums));

    if (!AlgoTrick::isSorted(merge_nums) || merge_nums != quick_nums) {
        spdlog::error("Sort results disagree.");
        return 1;
    }
    spdlog::debug("Input left unchanged: {}", formatVector(nums));

    return 0;
}
