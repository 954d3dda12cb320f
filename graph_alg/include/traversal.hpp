#ifndef ALGO_TRICK_TRAVERSAL_HPP
#define ALGO_TRICK_TRAVERSAL_HPP

#include <cstddef>
#include <map>
#include <vector>

namespace AlgoTrick {

// Directed, unweighted graph kept as adjacency lists.
// Neighbors are visited in the order their edges were added.
class AdjacencyGraph
{
public:
    AdjacencyGraph();

    void addEdge(int from, int to);

    /**
     * @brief Breadth-first visiting order from start.
     * Nodes are marked visited when enqueued, so each appears once.
     * @param start The first node; it need not have outgoing edges.
     * @return Nodes in the order they were dequeued.
     */
    std::vector<int> breadthFirst(int start) const;

    /**
     * @brief Depth-first (pre-order) visiting order from start.
     * Uses an explicit stack, so long paths do not grow the call stack.
     * @param start The first node; it need not have outgoing edges.
     * @return Nodes in the order they were first reached.
     */
    std::vector<int> depthFirst(int start) const;

    const std::vector<int>& neighbors(int node) const;
    std::size_t edgeCount() const;

private:
    std::map<int, std::vector<int>> adjacency_list_;
    std::size_t edge_count_;
};

} // namespace AlgoTrick

#endif // ALGO_TRICK_TRAVERSAL_HPP
