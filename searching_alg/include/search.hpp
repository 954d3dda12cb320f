#ifndef ALGO_TRICK_SEARCH_HPP
#define ALGO_TRICK_SEARCH_HPP

#include <cstddef>
#include <functional> // For std::less
#include <limits>
#include <memory>     // For std::unique_ptr
#include <string>
#include <utility>
#include <vector>

namespace AlgoTrick {

// Returned by binarySearch when the target is absent.
constexpr std::size_t kNotFound = std::numeric_limits<std::size_t>::max();

/**
 * @brief Binary search over a sequence sorted ascending under comp.
 * @param arr The sorted sequence (not checked; unsorted input gives an unspecified result).
 * @param target The value to look for.
 * @return Index of an element equal to target, or kNotFound.
 *         Which index is returned among duplicates is unspecified.
 */
template <typename T, typename Compare = std::less<T>>
std::size_t binarySearch(const std::vector<T>& arr, const T& target, Compare comp = Compare())
{
    if (arr.empty()) {
        return kNotFound;
    }

    std::size_t left = 0;
    std::size_t right = arr.size() - 1;

    while (left <= right) {
        std::size_t mid = left + (right - left) / 2;
        const T& mid_value = arr[mid];

        if (comp(mid_value, target)) {
            // Nothing to the right of the last element
            if (mid == arr.size() - 1) {
                return kNotFound;
            }
            left = mid + 1;
        } else if (comp(target, mid_value)) {
            // Nothing to the left of the first element; also keeps right from wrapping
            if (mid == 0) {
                return kNotFound;
            }
            right = mid - 1;
        } else {
            return mid;
        }
    }
    return kNotFound;
}

// Unbalanced binary search tree. Smaller values go left, everything else
// (duplicates included) goes right.
template <typename T>
class BinarySearchTree
{
public:
    BinarySearchTree() : size_(0) {}

    void insert(const T& value)
    {
        std::unique_ptr<Node>* link = &root_;
        while (*link) {
            link = (value < (*link)->value) ? &(*link)->left : &(*link)->right;
        }
        *link = std::make_unique<Node>(value);
        ++size_;
    }

    bool contains(const T& value) const
    {
        const Node* node = root_.get();
        while (node) {
            if (value < node->value) {
                node = node->left.get();
            } else if (node->value < value) {
                node = node->right.get();
            } else {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Collects all values by in-order traversal.
     * @return The stored values in ascending order.
     */
    std::vector<T> inorder() const
    {
        std::vector<T> result;
        result.reserve(size_);
        inorderTraversal(root_.get(), result);
        return result;
    }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

private:
    struct Node {
        explicit Node(const T& v) : value(v) {}
        T value;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
    };

    static void inorderTraversal(const Node* node, std::vector<T>& result)
    {
        if (!node) {
            return;
        }
        inorderTraversal(node->left.get(), result);
        result.push_back(node->value);
        inorderTraversal(node->right.get(), result);
    }

    std::unique_ptr<Node> root_;
    std::size_t size_;
};

extern template std::size_t binarySearch(const std::vector<int>&, const int&, std::less<int>);
extern template std::size_t binarySearch(const std::vector<double>&, const double&,
                                         std::less<double>);
extern template std::size_t binarySearch(const std::vector<std::string>&, const std::string&,
                                         std::less<std::string>);
extern template class BinarySearchTree<int>;
extern template class BinarySearchTree<std::string>;

} // namespace AlgoTrick

#endif // ALGO_TRICK_SEARCH_HPP
