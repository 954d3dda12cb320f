// dijkstra_tests.cpp
// Tests for DijkstraSolver, dijkstraShortestPath and dijkstraDense using doctest.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

#include <Eigen/Dense>

#include "dijkstra.hpp"

namespace testutil {

AlgoTrick::WeightedGraph sample_graph() {
    AlgoTrick::WeightedGraph g;
    g["A"] = {{"B", 1.0}, {"C", 4.0}};
    g["B"] = {{"C", 2.0}, {"D", 5.0}};
    g["C"] = {{"D", 1.0}};
    g["D"] = std::map<std::string, double>();
    return g;
}

// Random graph over nodes n0..n{size-1}; integer weights keep sums exact.
AlgoTrick::WeightedGraph random_graph(std::mt19937& rng, int size, double edge_prob) {
    std::bernoulli_distribution has_edge(edge_prob);
    std::uniform_int_distribution<int> weight(0, 9);
    AlgoTrick::WeightedGraph g;
    for (int i = 0; i < size; ++i) {
        auto& edges = g["n" + std::to_string(i)];
        for (int j = 0; j < size; ++j) {
            if (i != j && has_edge(rng)) {
                edges["n" + std::to_string(j)] = weight(rng);
            }
        }
    }
    return g;
}

void check_same_distances(const AlgoTrick::DistanceTable& a, const AlgoTrick::DistanceTable& b) {
    REQUIRE(a.size() == b.size());
    for (const auto& entry : a) {
        CAPTURE(entry.first);
        REQUIRE(b.count(entry.first) == 1);
        CHECK(entry.second == b.at(entry.first));
    }
}

} // namespace testutil

TEST_CASE("Sample graph distances from A") {
    auto d = AlgoTrick::dijkstraShortestPath(testutil::sample_graph(), "A");
    REQUIRE(d.size() == 4);
    CHECK(d["A"] == 0.0);
    CHECK(d["B"] == 1.0);
    CHECK(d["C"] == 3.0);
    CHECK(d["D"] == 4.0);
}

TEST_CASE("Unreachable nodes stay at infinity") {
    auto g = testutil::sample_graph();
    g["E"] = {{"A", 1.0}};
    g["F"] = std::map<std::string, double>();

    auto d = AlgoTrick::dijkstraShortestPath(g, "B");
    CHECK(d["B"] == 0.0);
    CHECK(d["C"] == 2.0);
    CHECK(d["D"] == 3.0);
    CHECK(std::isinf(d["A"]));
    CHECK(std::isinf(d["E"]));
    CHECK(std::isinf(d["F"]));
}

TEST_CASE("Single node graph") {
    AlgoTrick::WeightedGraph g;
    g["only"] = std::map<std::string, double>();
    auto d = AlgoTrick::dijkstraShortestPath(g, "only");
    REQUIRE(d.size() == 1);
    CHECK(d["only"] == 0.0);
}

TEST_CASE("Start node missing from the graph is rejected") {
    CHECK_THROWS_AS(AlgoTrick::dijkstraShortestPath(testutil::sample_graph(), "Z"),
                    std::invalid_argument);
    CHECK_THROWS_AS(AlgoTrick::dijkstraShortestPath(AlgoTrick::WeightedGraph(), "A"),
                    std::invalid_argument);
}

TEST_CASE("Negative weights are rejected unless the check is disabled") {
    auto g = testutil::sample_graph();
    g["C"]["D"] = -1.0;
    CHECK_THROWS_AS(AlgoTrick::dijkstraShortestPath(g, "A"), std::invalid_argument);

    AlgoTrick::DijkstraSolver solver;
    CHECK(solver.rejectsNegativeWeights());
    solver.setRejectNegativeWeights(false);
    CHECK_NOTHROW(solver.solve(g, "A"));
}

TEST_CASE("Neighbors that are not graph nodes are ignored") {
    AlgoTrick::WeightedGraph g;
    g["A"] = {{"B", 2.0}, {"ghost", 1.0}};
    g["B"] = std::map<std::string, double>();

    for (auto strategy : {AlgoTrick::SelectionStrategy::LinearScan,
                          AlgoTrick::SelectionStrategy::BinaryHeap}) {
        AlgoTrick::DijkstraSolver solver;
        solver.setSelectionStrategy(strategy);
        auto d = solver.solve(g, "A");
        CHECK(d.size() == 2);
        CHECK(d.count("ghost") == 0);
        CHECK(d["B"] == 2.0);
    }
}

TEST_CASE("Linear scan stops early once the rest is unreachable") {
    auto g = testutil::sample_graph();
    g["X"] = std::map<std::string, double>();
    g["Y"] = {{"X", 1.0}};

    AlgoTrick::DijkstraSolver solver;
    solver.solve(g, "A");
    CHECK(solver.lastVisitedCount() == 4);

    solver.solve(g, "D");
    CHECK(solver.lastVisitedCount() == 1);
}

TEST_CASE("Zero-weight edges and equal-distance ties") {
    AlgoTrick::WeightedGraph g;
    g["s"] = {{"a", 0.0}, {"b", 1.0}};
    g["a"] = {{"b", 1.0}, {"c", 0.0}};
    g["b"] = {{"c", 5.0}};
    g["c"] = {{"b", 1.0}};

    auto d = AlgoTrick::dijkstraShortestPath(g, "s");
    CHECK(d["s"] == 0.0);
    CHECK(d["a"] == 0.0);
    CHECK(d["c"] == 0.0);
    CHECK(d["b"] == 1.0);
}

TEST_CASE("Binary heap strategy matches the linear scan") {
    std::mt19937 rng(0x5EEDu);
    AlgoTrick::DijkstraSolver linear;
    AlgoTrick::DijkstraSolver heap;
    heap.setSelectionStrategy(AlgoTrick::SelectionStrategy::BinaryHeap);
    CHECK(heap.getSelectionStrategy() == AlgoTrick::SelectionStrategy::BinaryHeap);

    for (int round = 0; round < 20; ++round) {
        CAPTURE(round);
        auto g = testutil::random_graph(rng, 12, 0.25);
        testutil::check_same_distances(linear.solve(g, "n0"), heap.solve(g, "n0"));
    }
}

TEST_CASE("Distances satisfy the edge inequality") {
    std::mt19937 rng(0xD1Du);
    for (int round = 0; round < 10; ++round) {
        auto g = testutil::random_graph(rng, 15, 0.3);
        auto d = AlgoTrick::dijkstraShortestPath(g, "n0");
        CHECK(d["n0"] == 0.0);
        for (const auto& node : g) {
            if (std::isinf(d[node.first])) {
                continue;
            }
            for (const auto& edge : node.second) {
                CAPTURE(node.first);
                CAPTURE(edge.first);
                CHECK(d[edge.first] <= d[node.first] + edge.second);
            }
        }
    }
}

TEST_CASE("Dense matrix variant matches the adjacency map") {
    Eigen::MatrixXd w = Eigen::MatrixXd::Constant(4, 4, AlgoTrick::kInfinity);
    w(0, 1) = 1.0;
    w(0, 2) = 4.0;
    w(1, 2) = 2.0;
    w(1, 3) = 5.0;
    w(2, 3) = 1.0;

    Eigen::VectorXd d = AlgoTrick::dijkstraDense(w, 0);
    REQUIRE(d.size() == 4);
    CHECK(d(0) == 0.0);
    CHECK(d(1) == 1.0);
    CHECK(d(2) == 3.0);
    CHECK(d(3) == 4.0);

    Eigen::VectorXd from_c = AlgoTrick::dijkstraDense(w, 2);
    CHECK(std::isinf(from_c(0)));
    CHECK(std::isinf(from_c(1)));
    CHECK(from_c(2) == 0.0);
    CHECK(from_c(3) == 1.0);
}

TEST_CASE("Dense matrix variant agrees on random graphs") {
    std::mt19937 rng(0xFACEu);
    const int size = 10;
    for (int round = 0; round < 10; ++round) {
        auto g = testutil::random_graph(rng, size, 0.3);
        Eigen::MatrixXd w = Eigen::MatrixXd::Constant(size, size, AlgoTrick::kInfinity);
        for (int i = 0; i < size; ++i) {
            for (const auto& edge : g["n" + std::to_string(i)]) {
                w(i, std::stoi(edge.first.substr(1))) = edge.second;
            }
        }

        auto expected = AlgoTrick::dijkstraShortestPath(g, "n0");
        Eigen::VectorXd d = AlgoTrick::dijkstraDense(w, 0);
        for (int i = 0; i < size; ++i) {
            CAPTURE(i);
            CHECK(d(i) == expected["n" + std::to_string(i)]);
        }
    }
}

TEST_CASE("Dense matrix variant validates its input") {
    CHECK_THROWS_AS(AlgoTrick::dijkstraDense(Eigen::MatrixXd::Zero(2, 3), 0),
                    std::invalid_argument);
    CHECK_THROWS_AS(AlgoTrick::dijkstraDense(Eigen::MatrixXd::Zero(3, 3), 3),
                    std::invalid_argument);
    CHECK_THROWS_AS(AlgoTrick::dijkstraDense(Eigen::MatrixXd::Zero(3, 3), -1),
                    std::invalid_argument);

    Eigen::MatrixXd w = Eigen::MatrixXd::Zero(3, 3);
    w(1, 2) = -0.5;
    CHECK_THROWS_AS(AlgoTrick::dijkstraDense(w, 0), std::invalid_argument);
}
