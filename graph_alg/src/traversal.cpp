#include "traversal.hpp"

#include <queue>
#include <set>

#include <spdlog/spdlog.h>

namespace AlgoTrick {

namespace {
const std::vector<int> kNoNeighbors;
}

AdjacencyGraph::AdjacencyGraph()
    : edge_count_(0)
{
}

void AdjacencyGraph::addEdge(int from, int to)
{
    adjacency_list_[from].push_back(to);
    ++edge_count_;
}

std::vector<int> AdjacencyGraph::breadthFirst(int start) const
{
    std::set<int> visited;
    std::queue<int> queue;
    std::vector<int> order;

    queue.push(start);
    visited.insert(start);

    while (!queue.empty())
    {
        int node = queue.front();
        queue.pop();
        order.push_back(node);

        for (int neighbor : neighbors(node))
        {
            if (visited.insert(neighbor).second)
            {
                queue.push(neighbor);
            }
        }
    }

    spdlog::debug("BFS from {} reached {} node(s).", start, order.size());
    return order;
}

std::vector<int> AdjacencyGraph::depthFirst(int start) const
{
    std::set<int> visited;
    std::vector<int> order;
    std::vector<int> stack;

    stack.push_back(start);
    while (!stack.empty())
    {
        int node = stack.back();
        stack.pop_back();
        if (!visited.insert(node).second)
        {
            continue;
        }
        order.push_back(node);

        // Reverse push so the first-added neighbor is explored first
        const std::vector<int>& next = neighbors(node);
        for (auto it = next.rbegin(); it != next.rend(); ++it)
        {
            if (visited.count(*it) == 0)
            {
                stack.push_back(*it);
            }
        }
    }

    spdlog::debug("DFS from {} reached {} node(s).", start, order.size());
    return order;
}

const std::vector<int>& AdjacencyGraph::neighbors(int node) const
{
    auto it = adjacency_list_.find(node);
    if (it == adjacency_list_.end())
    {
        return kNoNeighbors;
    }
    return it->second;
}

std::size_t AdjacencyGraph::edgeCount() const
{
    return edge_count_;
}

} // namespace AlgoTrick
