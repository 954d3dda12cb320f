#include "fibonacci.hpp"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

namespace AlgoTrick {

namespace {

typedef Eigen::Matrix<std::uint64_t, 2, 2> Matrix2u64;

void checkIndex(int n)
{
    if (n < 0) {
        throw std::invalid_argument("Fibonacci index must be non-negative, got " +
                                    std::to_string(n));
    }
    if (n > kMaxFibonacciIndex) {
        throw std::out_of_range("Fibonacci index " + std::to_string(n) +
                                " overflows 64 bits (max " +
                                std::to_string(kMaxFibonacciIndex) + ")");
    }
}

std::uint64_t memoHelper(int num, std::unordered_map<int, std::uint64_t>& memo)
{
    auto it = memo.find(num);
    if (it != memo.end()) {
        return it->second;
    }
    if (num <= 1) {
        return static_cast<std::uint64_t>(num);
    }

    std::uint64_t result = memoHelper(num - 1, memo) + memoHelper(num - 2, memo);
    memo[num] = result;
    return result;
}

std::uint64_t naiveHelper(int num)
{
    if (num <= 1) {
        return static_cast<std::uint64_t>(num);
    }
    return naiveHelper(num - 1) + naiveHelper(num - 2);
}

} // namespace

// --- Memoized ---
std::uint64_t fibonacciMemo(int n) {
    checkIndex(n);

    std::unordered_map<int, std::uint64_t> memo;
    std::uint64_t result = memoHelper(n, memo);
    spdlog::debug("fibonacciMemo({}) = {} with {} memo entries", n, result, memo.size());
    return result;
}

// --- Naive ---
std::uint64_t fibonacciNaive(int n) {
    checkIndex(n);
    return naiveHelper(n);
}

// --- Bottom-up ---
std::uint64_t fibonacciIterative(int n) {
    checkIndex(n);

    std::vector<std::uint64_t> table(static_cast<std::size_t>(n) + 1, 0);
    if (n >= 1) {
        table[1] = 1;
    }
    for (int i = 2; i <= n; ++i) {
        table[i] = table[i - 1] + table[i - 2];
    }
    return table[n];
}

// --- Matrix power ---
std::uint64_t fibonacciMatrix(int n) {
    checkIndex(n);

    // M^k = [[F(k+1), F(k)], [F(k), F(k-1)]]. F(94) in the top-left wraps at
    // n = 93, but unsigned arithmetic is modulo 2^64 so F(n) itself is exact.
    Matrix2u64 result = Matrix2u64::Identity();
    Matrix2u64 base;
    base << 1, 1,
            1, 0;

    int exponent = n;
    while (exponent > 0) {
        if (exponent & 1) {
            result = (result * base).eval();
        }
        base = (base * base).eval();
        exponent >>= 1;
    }
    return result(0, 1);
}

} // namespace AlgoTrick
