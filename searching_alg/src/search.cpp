#include "search.hpp"

namespace AlgoTrick {

// --- Binary Search ---
template std::size_t binarySearch(const std::vector<int>&, const int&, std::less<int>);
template std::size_t binarySearch(const std::vector<double>&, const double&, std::less<double>);
template std::size_t binarySearch(const std::vector<std::string>&, const std::string&,
                                  std::less<std::string>);

// --- Binary Search Tree ---
template class BinarySearchTree<int>;
template class BinarySearchTree<std::string>;

} // namespace AlgoTrick
