#ifndef ALGO_TRICK_FIBONACCI_HPP
#define ALGO_TRICK_FIBONACCI_HPP

#include <cstdint>

namespace AlgoTrick {

// Largest n for which F(n) fits in 64 bits.
constexpr int kMaxFibonacciIndex = 93;

// All evaluators compute F(n) with F(0) = 0, F(1) = 1, F(k) = F(k-1) + F(k-2).
// They throw std::invalid_argument for n < 0 and std::out_of_range for
// n > kMaxFibonacciIndex.

// Memoized recursion. The memo table lives for one call only.
// Time Complexity: O(n), Space Complexity: O(n)
std::uint64_t fibonacciMemo(int n);

// Plain recursion, exponential. Reference for small n.
std::uint64_t fibonacciNaive(int n);

// Bottom-up table.
std::uint64_t fibonacciIterative(int n);

// [[1,1],[1,0]]^n by repeated squaring.
// Time Complexity: O(log n)
std::uint64_t fibonacciMatrix(int n);

} // namespace AlgoTrick

#endif // ALGO_TRICK_FIBONACCI_HPP
