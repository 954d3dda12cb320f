#include <exception>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>        // For logging
#include <spdlog/fmt/ranges.h>    // For fmt::join

#include "demo_logging.hpp"
#include "dijkstra.hpp"
#include "traversal.hpp"

namespace {

AlgoTrick::WeightedGraph sampleGraph()
{
    AlgoTrick::WeightedGraph graph;
    graph["A"] = {{"B", 1.0}, {"C", 4.0}};
    graph["B"] = {{"C", 2.0}, {"D", 5.0}};
    graph["C"] = {{"D", 1.0}};
    graph["D"] = std::map<std::string, double>();
    return graph;
}

void logDistances(const std::string& label, const AlgoTrick::DistanceTable& distances)
{
    for (const auto& entry : distances)
    {
        spdlog::info("{} distance to {}: {}", label, entry.first, entry.second);
    }
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args = AlgoTrick::initDemoLogging(argc, argv);
    std::string start = args.empty() ? "A" : args[0];

    AlgoTrick::WeightedGraph graph = sampleGraph();

    try
    {
        AlgoTrick::DijkstraSolver solver;
        logDistances("[linear scan]", solver.solve(graph, start));
        spdlog::info("Linear scan settled {} node(s).", solver.lastVisitedCount());

        solver.setSelectionStrategy(AlgoTrick::SelectionStrategy::BinaryHeap);
        logDistances("[binary heap]", solver.solve(graph, start));

        // Same graph as a dense matrix, nodes A..D mapped to 0..3
        Eigen::MatrixXd weights = Eigen::MatrixXd::Constant(4, 4, AlgoTrick::kInfinity);
        weights(0, 1) = 1.0;
        weights(0, 2) = 4.0;
        weights(1, 2) = 2.0;
        weights(1, 3) = 5.0;
        weights(2, 3) = 1.0;
        Eigen::VectorXd dense = AlgoTrick::dijkstraDense(weights, 0);
        spdlog::info("[dense] distances from node 0: {}",
                     fmt::join(dense.data(), dense.data() + dense.size(), " "));
    }
    catch (const std::exception& e)
    {
        spdlog::error("Shortest path failed: {}", e.what());
        return 1;
    }

    AlgoTrick::AdjacencyGraph traversal_graph;
    traversal_graph.addEdge(1, 2);
    traversal_graph.addEdge(1, 3);
    traversal_graph.addEdge(2, 4);
    traversal_graph.addEdge(3, 4);
    traversal_graph.addEdge(4, 5);

    spdlog::info("BFS from 1: {}", fmt::join(traversal_graph.breadthFirst(1), " "));
    spdlog::info("DFS from 1: {}", fmt::join(traversal_graph.depthFirst(1), " "));

    return 0;
}
