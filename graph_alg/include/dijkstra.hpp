#ifndef ALGO_TRICK_DIJKSTRA_HPP
#define ALGO_TRICK_DIJKSTRA_HPP

#include <cstddef>
#include <string>

#include <Eigen/Dense> // For the dense adjacency matrix variant

#include "weighted_graph.hpp"

namespace AlgoTrick {

// How the next node to settle is picked.
enum class SelectionStrategy {
    LinearScan, // O(V^2), scans every unvisited node
    BinaryHeap  // O((V + E) log V), std::priority_queue with lazy deletion
};

class DijkstraSolver
{
public:
    DijkstraSolver();

    /**
     * @brief Computes single-source shortest distances.
     * @param graph The adjacency map. It is only read.
     * @param start The source node; must be a key of graph.
     * @return Distance for every node; unreachable nodes map to kInfinity.
     * @throws std::invalid_argument if start is not in graph, or if a weight is
     *         negative (or NaN) while negative weights are rejected.
     */
    DistanceTable solve(const WeightedGraph& graph, const std::string& start);

    /**
     * @brief Sets how the minimum-distance node is selected.
     * Both strategies produce identical distances.
     * @param strategy LinearScan (default) or BinaryHeap.
     */
    void setSelectionStrategy(SelectionStrategy strategy);

    /**
     * @brief Enables or disables the up-front weight check.
     * With the check disabled, negative weights give unspecified distances.
     * @param reject True (default) to throw on negative weights.
     */
    void setRejectNegativeWeights(bool reject);

    SelectionStrategy getSelectionStrategy() const;
    bool rejectsNegativeWeights() const;

    /**
     * @brief Number of nodes settled by the last call to solve().
     */
    std::size_t lastVisitedCount() const;

private:
    DistanceTable solveLinearScan(const WeightedGraph& graph, const std::string& start);
    DistanceTable solveBinaryHeap(const WeightedGraph& graph, const std::string& start);

    SelectionStrategy strategy_;
    bool reject_negative_weights_;
    std::size_t last_visited_count_;
};

// Shortest distances with the default solver (linear scan, weights checked).
DistanceTable dijkstraShortestPath(const WeightedGraph& graph, const std::string& start);

// Same algorithm over a dense V x V weight matrix.
// weights(i, j) is the edge i -> j; kInfinity means no edge. The diagonal is ignored.
// Throws std::invalid_argument for a non-square matrix, a start outside [0, V)
// or a negative entry.
Eigen::VectorXd dijkstraDense(const Eigen::MatrixXd& weights, Eigen::Index start);

} // namespace AlgoTrick

#endif // ALGO_TRICK_DIJKSTRA_HPP
