#ifndef ALGO_TRICK_SORT_HPP
#define ALGO_TRICK_SORT_HPP

#include <cstddef>
#include <functional> // For std::less
#include <string>
#include <utility>    // For std::swap
#include <vector>

namespace AlgoTrick {

// Merge two sorted runs into one sorted run.
// Ties are taken from the left run first, which keeps mergeSort stable.
template <typename T, typename Compare = std::less<T>>
std::vector<T> merge(const std::vector<T>& left, const std::vector<T>& right,
                     Compare comp = Compare())
{
    std::vector<T> result;
    result.reserve(left.size() + right.size());

    std::size_t i = 0, j = 0;
    while (i < left.size() && j < right.size()) {
        // left[i] <= right[j]
        if (!comp(right[j], left[i])) {
            result.push_back(left[i++]);
        } else {
            result.push_back(right[j++]);
        }
    }
    while (i < left.size()) {
        result.push_back(left[i++]);
    }
    while (j < right.size()) {
        result.push_back(right[j++]);
    }
    return result;
}

// Merge Sort
// Returns a new sorted sequence; the input is left untouched. Stable.
// Time Complexity: O(n log n), Space Complexity: O(n log n)
template <typename T, typename Compare = std::less<T>>
std::vector<T> mergeSort(const std::vector<T>& arr, Compare comp = Compare())
{
    if (arr.size() <= 1) {
        return arr;
    }

    auto mid = arr.begin() + static_cast<std::ptrdiff_t>(arr.size() / 2);
    std::vector<T> left = mergeSort(std::vector<T>(arr.begin(), mid), comp);
    std::vector<T> right = mergeSort(std::vector<T>(mid, arr.end()), comp);

    return merge(left, right, comp);
}

namespace detail {

// Lomuto partition: last element is the pivot.
template <typename T, typename Compare>
std::size_t lomutoPartition(std::vector<T>& arr, std::size_t low, std::size_t high,
                            Compare& comp)
{
    const T pivot = arr[high];
    std::size_t store = low;

    for (std::size_t j = low; j < high; ++j) {
        if (comp(arr[j], pivot)) {
            std::swap(arr[store], arr[j]);
            ++store;
        }
    }
    std::swap(arr[store], arr[high]);
    return store;
}

// Recurses into the smaller side and loops on the larger one, so the
// stack depth stays O(log n) even when every split is lopsided.
template <typename T, typename Compare>
void quickSortRecursive(std::vector<T>& arr, std::size_t low, std::size_t high,
                        Compare& comp)
{
    while (low < high) {
        std::size_t pi = lomutoPartition(arr, low, high, comp);
        if (pi - low < high - pi) {
            if (pi > low) {
                quickSortRecursive(arr, low, pi - 1, comp);
            }
            low = pi + 1;
        } else {
            quickSortRecursive(arr, pi + 1, high, comp);
            if (pi == low) {
                return;
            }
            high = pi - 1;
        }
    }
}

} // namespace detail

// Quick Sort
// Sorts a copy in place with Lomuto partitioning. Not stable.
// Time Complexity: O(n log n) average, O(n^2) worst, Space Complexity: O(n)
template <typename T, typename Compare = std::less<T>>
std::vector<T> quickSort(const std::vector<T>& arr, Compare comp = Compare())
{
    std::vector<T> result(arr);
    if (result.size() > 1) {
        detail::quickSortRecursive(result, 0, result.size() - 1, comp);
    }
    return result;
}

template <typename T, typename Compare = std::less<T>>
bool isSorted(const std::vector<T>& arr, Compare comp = Compare())
{
    for (std::size_t i = 1; i < arr.size(); ++i) {
        if (comp(arr[i], arr[i - 1])) {
            return false;
        }
    }
    return true;
}

// Instantiated once in sort.cpp for the common element types.
extern template std::vector<int> mergeSort(const std::vector<int>&, std::less<int>);
extern template std::vector<double> mergeSort(const std::vector<double>&, std::less<double>);
extern template std::vector<std::string> mergeSort(const std::vector<std::string>&,
                                                   std::less<std::string>);
extern template std::vector<int> quickSort(const std::vector<int>&, std::less<int>);
extern template std::vector<double> quickSort(const std::vector<double>&, std::less<double>);
extern template std::vector<std::string> quickSort(const std::vector<std::string>&,
                                                   std::less<std::string>);

} // namespace AlgoTrick

#endif // ALGO_TRICK_SORT_HPP
