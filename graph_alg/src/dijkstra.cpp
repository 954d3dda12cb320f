#include "dijkstra.hpp"

#include <functional> // For std::greater
#include <iterator>   // For std::next
#include <queue>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace AlgoTrick {

namespace {

void checkStartNode(const WeightedGraph& graph, const std::string& start)
{
    if (graph.find(start) == graph.end())
    {
        throw std::invalid_argument("Start node '" + start + "' is not in the graph");
    }
}

void checkWeights(const WeightedGraph& graph)
{
    for (const auto& node : graph)
    {
        for (const auto& edge : node.second)
        {
            // Also catches NaN
            if (!(edge.second >= 0.0))
            {
                throw std::invalid_argument("Edge " + node.first + " -> " + edge.first +
                                            " has negative weight " + std::to_string(edge.second));
            }
        }
    }
}

DistanceTable initialDistances(const WeightedGraph& graph, const std::string& start)
{
    DistanceTable distances;
    for (const auto& node : graph)
    {
        distances[node.first] = kInfinity;
    }
    distances[start] = 0.0;
    return distances;
}

} // namespace

DijkstraSolver::DijkstraSolver()
    : strategy_(SelectionStrategy::LinearScan),
      reject_negative_weights_(true),
      last_visited_count_(0)
{
}

DistanceTable DijkstraSolver::solve(const WeightedGraph& graph, const std::string& start)
{
    checkStartNode(graph, start);
    if (reject_negative_weights_)
    {
        checkWeights(graph);
    }

    last_visited_count_ = 0;
    if (strategy_ == SelectionStrategy::BinaryHeap)
    {
        return solveBinaryHeap(graph, start);
    }
    return solveLinearScan(graph, start);
}

DistanceTable DijkstraSolver::solveLinearScan(const WeightedGraph& graph, const std::string& start)
{
    DistanceTable distances = initialDistances(graph, start);

    std::set<std::string> unvisited;
    for (const auto& node : graph)
    {
        unvisited.insert(node.first);
    }

    while (!unvisited.empty())
    {
        // Strict '<' keeps the first key among equal minima
        auto current = unvisited.begin();
        for (auto it = std::next(unvisited.begin()); it != unvisited.end(); ++it)
        {
            if (distances[*it] < distances[*current])
            {
                current = it;
            }
        }

        const double current_distance = distances[*current];
        if (current_distance == kInfinity)
        {
            spdlog::debug("Dijkstra: {} node(s) unreachable from '{}', stopping early.",
                          unvisited.size(), start);
            break;
        }

        for (const auto& edge : graph.at(*current))
        {
            const std::string& neighbor = edge.first;
            if (unvisited.count(neighbor) == 0)
            {
                if (distances.count(neighbor) == 0)
                {
                    spdlog::warn("Dijkstra: neighbor '{}' of '{}' is not a graph node, skipped.",
                                 neighbor, *current);
                }
                continue;
            }

            double new_distance = current_distance + edge.second;
            if (new_distance < distances[neighbor])
            {
                distances[neighbor] = new_distance;
            }
        }

        unvisited.erase(current);
        ++last_visited_count_;
    }

    return distances;
}

DistanceTable DijkstraSolver::solveBinaryHeap(const WeightedGraph& graph, const std::string& start)
{
    typedef std::pair<double, std::string> QueueEntry;

    DistanceTable distances = initialDistances(graph, start);
    std::set<std::string> visited;

    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> queue;
    queue.push(QueueEntry(0.0, start));

    while (!queue.empty())
    {
        QueueEntry top = queue.top();
        queue.pop();

        const std::string& current = top.second;
        // Stale entry left behind by a later improvement
        if (visited.count(current) > 0 || top.first > distances[current])
        {
            continue;
        }
        visited.insert(current);
        ++last_visited_count_;

        for (const auto& edge : graph.at(current))
        {
            const std::string& neighbor = edge.first;
            auto found = distances.find(neighbor);
            if (found == distances.end())
            {
                spdlog::warn("Dijkstra: neighbor '{}' of '{}' is not a graph node, skipped.",
                             neighbor, current);
                continue;
            }
            if (visited.count(neighbor) > 0)
            {
                continue;
            }

            double new_distance = top.first + edge.second;
            if (new_distance < found->second)
            {
                found->second = new_distance;
                queue.push(QueueEntry(new_distance, neighbor));
            }
        }
    }

    spdlog::debug("Dijkstra (heap): settled {} of {} node(s) from '{}'.",
                  last_visited_count_, graph.size(), start);
    return distances;
}

void DijkstraSolver::setSelectionStrategy(SelectionStrategy strategy)
{
    strategy_ = strategy;
}

void DijkstraSolver::setRejectNegativeWeights(bool reject)
{
    reject_negative_weights_ = reject;
}

SelectionStrategy DijkstraSolver::getSelectionStrategy() const
{
    return strategy_;
}

bool DijkstraSolver::rejectsNegativeWeights() const
{
    return reject_negative_weights_;
}

std::size_t DijkstraSolver::lastVisitedCount() const
{
    return last_visited_count_;
}

DistanceTable dijkstraShortestPath(const WeightedGraph& graph, const std::string& start)
{
    DijkstraSolver solver;
    return solver.solve(graph, start);
}

Eigen::VectorXd dijkstraDense(const Eigen::MatrixXd& weights, Eigen::Index start)
{
    if (weights.rows() != weights.cols())
    {
        throw std::invalid_argument("Weight matrix must be square, got " +
                                    std::to_string(weights.rows()) + "x" +
                                    std::to_string(weights.cols()));
    }
    const Eigen::Index n = weights.rows();
    if (start < 0 || start >= n)
    {
        throw std::invalid_argument("Start index " + std::to_string(start) +
                                    " is outside [0, " + std::to_string(n) + ")");
    }
    for (Eigen::Index i = 0; i < n; ++i)
    {
        for (Eigen::Index j = 0; j < n; ++j)
        {
            if (i != j && !(weights(i, j) >= 0.0))
            {
                throw std::invalid_argument("Weight (" + std::to_string(i) + ", " +
                                            std::to_string(j) + ") is negative");
            }
        }
    }

    Eigen::VectorXd distances = Eigen::VectorXd::Constant(n, kInfinity);
    distances(start) = 0.0;
    std::vector<bool> visited(static_cast<std::size_t>(n), false);

    for (Eigen::Index step = 0; step < n; ++step)
    {
        Eigen::Index current = -1;
        for (Eigen::Index i = 0; i < n; ++i)
        {
            if (!visited[static_cast<std::size_t>(i)] &&
                (current < 0 || distances(i) < distances(current)))
            {
                current = i;
            }
        }

        if (distances(current) == kInfinity)
        {
            spdlog::debug("Dijkstra (dense): {} node(s) unreachable from {}, stopping early.",
                          n - step, start);
            break;
        }

        for (Eigen::Index j = 0; j < n; ++j)
        {
            if (j == current || visited[static_cast<std::size_t>(j)])
            {
                continue;
            }
            double new_distance = distances(current) + weights(current, j);
            if (new_distance < distances(j))
            {
                distances(j) = new_distance;
            }
        }
        visited[static_cast<std::size_t>(current)] = true;
    }

    return distances;
}

} // namespace AlgoTrick
