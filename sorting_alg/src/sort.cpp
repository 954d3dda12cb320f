#include "sort.hpp"

namespace AlgoTrick {

// --- Merge Sort ---
template std::vector<int> mergeSort(const std::vector<int>&, std::less<int>);
template std::vector<double> mergeSort(const std::vector<double>&, std::less<double>);
template std::vector<std::string> mergeSort(const std::vector<std::string>&,
                                            std::less<std::string>);

// --- Quick Sort ---
template std::vector<int> quickSort(const std::vector<int>&, std::less<int>);
template std::vector<double> quickSort(const std::vector<double>&, std::less<double>);
template std::vector<std::string> quickSort(const std::vector<std::string>&,
                                            std::less<std::string>);

} // namespace AlgoTrick
