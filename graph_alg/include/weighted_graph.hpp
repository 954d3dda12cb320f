#ifndef ALGO_TRICK_WEIGHTED_GRAPH_HPP
#define ALGO_TRICK_WEIGHTED_GRAPH_HPP

#include <limits>
#include <map>
#include <string>

namespace AlgoTrick {

// Adjacency map: node -> {neighbor -> non-negative edge weight}.
// The node set is the key set; a neighbor that is not a key is not a node.
typedef std::map<std::string, std::map<std::string, double>> WeightedGraph;

// Node -> best known distance from the start node.
typedef std::map<std::string, double> DistanceTable;

constexpr double kInfinity = std::numeric_limits<double>::infinity();

} // namespace AlgoTrick

#endif // ALGO_TRICK_WEIGHTED_GRAPH_HPP
