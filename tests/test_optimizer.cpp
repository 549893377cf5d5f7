#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <climits>
#include <random>
#include <set>
#include "optimizer.hpp"
#include "test_helpers.hpp"

static RoutingRequest line_request(const std::vector<double> &positions, const std::vector<int> &demands,
                                   const std::vector<int> &capacities) {
    RoutingRequest req;
    req.matrix = line_matrix(positions);
    req.num_vehicles = capacities.size();
    req.capacities = capacities;
    req.demands = {0};
    req.demands.insert(req.demands.end(), demands.begin(), demands.end());
    req.depot = 0;
    return req;
}

static SearchParameters quick(FirstSolutionStrategy s, LocalSearchMetaheuristic m) {
    SearchParameters p;
    p.first_solution_strategy = s;
    p.metaheuristic = m;
    p.time_limit_seconds = 1.0;
    return p;
}

// Every customer exactly once, every route closed at the depot.
static void expect_well_formed(const RoutingRequest &req, const OptimizerResult &res) {
    ASSERT_EQ((int)res.routes.size(), req.num_vehicles);
    std::multiset<int> visited;
    for (auto &r : res.routes) {
        ASSERT_GE(r.nodes.size(), 2u);
        EXPECT_EQ(r.nodes.front(), req.depot);
        EXPECT_EQ(r.nodes.back(), req.depot);
        for (size_t k = 1; k + 1 < r.nodes.size(); k++) visited.insert(r.nodes[k]);
    }
    for (int c = 1; c < (int)req.demands.size(); c++) EXPECT_EQ(visited.count(c), 1u) << "customer " << c;
    EXPECT_EQ(visited.size(), req.demands.size() - 1);
}

static long long route_load(const RoutingRequest &req, const VehicleRoute &r) {
    long long load = 0;
    for (int n : r.nodes) load += req.demands[n];
    return load;
}

TEST(ValidateRequest, CatchesInconsistentSizes) {
    std::string error;
    RoutingRequest ok = line_request({0, 1, 2}, {1, 1}, {5});
    EXPECT_TRUE(validate_request(ok, error));

    RoutingRequest r = ok;
    r.capacities = {5, 5};
    EXPECT_FALSE(validate_request(r, error));

    r = ok;
    r.demands = {0, 1};
    EXPECT_FALSE(validate_request(r, error));

    r = ok;
    r.capacities = {0};
    EXPECT_FALSE(validate_request(r, error));

    r = ok;
    r.depot = 3;
    EXPECT_FALSE(validate_request(r, error));

    r = ok;
    r.num_vehicles = 0;
    r.capacities = {};
    EXPECT_FALSE(validate_request(r, error));
}

TEST(LocalSearchOptimizer, InvalidRequestIsNotFound) {
    LocalSearchOptimizer opt;
    RoutingRequest req = line_request({0, 1}, {1}, {5});
    req.demands = {0};
    OptimizerResult res = opt.solve(req, SearchParameters{});
    EXPECT_FALSE(res.found);
    EXPECT_NE(res.message.find("invalid routing request"), std::string::npos);
}

TEST(LocalSearchOptimizer, StraightLineIsOptimal) {
    LocalSearchOptimizer opt;
    RoutingRequest req = line_request({0, 1, 2, 3, 4, 5}, {1, 1, 1, 1, 1}, {10});
    OptimizerResult res =
        opt.solve(req, quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent));

    ASSERT_TRUE(res.found);
    EXPECT_TRUE(res.capacity_feasible);
    expect_well_formed(req, res);
    EXPECT_DOUBLE_EQ(res.objective, 10.0);
    EXPECT_DOUBLE_EQ(res.objective, routes_cost(req.matrix, res.routes));
}

TEST(LocalSearchOptimizer, RespectsCapacityWhenFeasible) {
    std::vector<std::pair<FirstSolutionStrategy, LocalSearchMetaheuristic>> configs = {
        {FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent},
        {FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GuidedLocalSearch},
        {FirstSolutionStrategy::Savings, LocalSearchMetaheuristic::GreedyDescent},
        {FirstSolutionStrategy::Savings, LocalSearchMetaheuristic::GuidedLocalSearch},
    };

    for (auto &c : configs) {
        LocalSearchOptimizer opt;
        RoutingRequest req = line_request({0, -3, -2, -1, 1, 2, 3}, {3, 3, 3, 3, 3, 3}, {10, 10});
        OptimizerResult res = opt.solve(req, quick(c.first, c.second));

        ASSERT_TRUE(res.found) << to_string(c.first) << "/" << to_string(c.second);
        EXPECT_TRUE(res.capacity_feasible);
        expect_well_formed(req, res);
        for (auto &r : res.routes) EXPECT_LE(route_load(req, r), 10);
        EXPECT_DOUBLE_EQ(res.objective, 12.0) << to_string(c.first) << "/" << to_string(c.second);
    }
}

TEST(LocalSearchOptimizer, SavingsKeepsClustersApart) {
    LocalSearchOptimizer opt;
    RoutingRequest req = line_request({0, -10, -11, 10, 11}, {1, 1, 1, 1}, {2, 2});
    OptimizerResult res =
        opt.solve(req, quick(FirstSolutionStrategy::Savings, LocalSearchMetaheuristic::GreedyDescent));

    ASSERT_TRUE(res.found);
    expect_well_formed(req, res);
    EXPECT_DOUBLE_EQ(res.objective, 44.0);
    for (auto &r : res.routes) {
        ASSERT_EQ(r.nodes.size(), 4u);
        bool left = r.nodes[1] <= 2;
        EXPECT_EQ(r.nodes[2] <= 2, left);
    }
}

TEST(LocalSearchOptimizer, OverflowPlacesEveryone) {
    LocalSearchOptimizer opt;
    RoutingRequest req = line_request({0, 1, 2, 3}, {3, 3, 3}, {5});
    SearchParameters p = quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent);
    p.allow_overflow = true;

    OptimizerResult res = opt.solve(req, p);
    ASSERT_TRUE(res.found);
    EXPECT_FALSE(res.capacity_feasible);
    expect_well_formed(req, res);
}

TEST(LocalSearchOptimizer, OverflowSpreadsTrips) {
    LocalSearchOptimizer opt;
    // each vehicle carries two customers per trip; eight customers over two vehicles
    RoutingRequest req = line_request({0, 1, 2, 3, 4, 5, 6, 7, 8}, {5, 5, 5, 5, 5, 5, 5, 5}, {10, 10});
    SearchParameters p = quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent);

    OptimizerResult res = opt.solve(req, p);
    ASSERT_TRUE(res.found);
    expect_well_formed(req, res);
    for (auto &r : res.routes) EXPECT_LE(route_load(req, r), 20);
}

TEST(LocalSearchOptimizer, NoOverflowMeansNoSolution) {
    LocalSearchOptimizer opt;
    RoutingRequest req = line_request({0, 1, 2, 3}, {3, 3, 3}, {5});
    SearchParameters p = quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent);
    p.allow_overflow = false;

    OptimizerResult res = opt.solve(req, p);
    EXPECT_FALSE(res.found);
    EXPECT_TRUE(res.routes.empty());
    EXPECT_NE(res.message.find("do not fit"), std::string::npos);
    EXPECT_NE(res.message.find("1 vehicles"), std::string::npos);
}

TEST(LocalSearchOptimizer, OversizedCustomerWithoutOverflow) {
    LocalSearchOptimizer opt;
    RoutingRequest req = line_request({0, 1, 2}, {2, 6}, {5, 5});
    SearchParameters p = quick(FirstSolutionStrategy::Savings, LocalSearchMetaheuristic::GreedyDescent);
    p.allow_overflow = false;
    EXPECT_FALSE(opt.solve(req, p).found);

    p.allow_overflow = true;
    OptimizerResult res = opt.solve(req, p);
    ASSERT_TRUE(res.found);
    EXPECT_FALSE(res.capacity_feasible);
    expect_well_formed(req, res);
}

TEST(LocalSearchOptimizer, IdleVehiclesGetDepotOnlyRoutes) {
    LocalSearchOptimizer opt;
    RoutingRequest req = line_request({0, 1}, {1}, {5, 5, 5});
    OptimizerResult res =
        opt.solve(req, quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GuidedLocalSearch));
    ASSERT_TRUE(res.found);
    expect_well_formed(req, res);
    int idle = std::count_if(res.routes.begin(), res.routes.end(),
                             [](const VehicleRoute &r) { return r.nodes.size() == 2; });
    EXPECT_EQ(idle, 2);
    EXPECT_DOUBLE_EQ(res.objective, 2.0);
}

TEST(LocalSearchOptimizer, TimeLimitHoldsOnLargeInstance) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coord(0.0, 20000.0);
    int n = 1200;
    std::vector<double> x(n + 1), y(n + 1);
    for (int i = 0; i <= n; i++) {
        x[i] = coord(rng);
        y[i] = coord(rng);
    }

    RoutingRequest req;
    req.num_vehicles = 1;
    req.capacities = {n};
    req.demands.assign(n + 1, 1);
    req.demands[0] = 0;
    req.depot = 0;
    req.matrix.assign(n + 1, std::vector<double>(n + 1, 0.0));
    for (int i = 0; i <= n; i++)
        for (int j = 0; j <= n; j++)
            req.matrix[i][j] = std::hypot(x[i] - x[j], y[i] - y[j]);

    SearchParameters p = quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent);
    auto start = std::chrono::steady_clock::now();
    OptimizerResult res = LocalSearchOptimizer().solve(req, p);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(res.found);
    expect_well_formed(req, res);
    EXPECT_LT(elapsed, 3 * p.time_limit_seconds);
}

TEST(LocalSearchOptimizer, AsymmetricDistancesKeepDirection) {
    // going right is cheap, coming back left is expensive
    int n = 5;
    RoutingRequest req;
    req.num_vehicles = 1;
    req.capacities = {10};
    req.demands = {0, 1, 1, 1, 1};
    req.depot = 0;
    req.matrix.assign(n, std::vector<double>(n, 0.0));
    for (int i = 0; i < n; i++)
        for (int j = 0; j < n; j++)
            req.matrix[i][j] = (j > i) ? (j - i) : 10.0 * (i - j);

    for (auto s : {FirstSolutionStrategy::PathCheapestArc, FirstSolutionStrategy::Savings}) {
        OptimizerResult res = LocalSearchOptimizer().solve(req, quick(s, LocalSearchMetaheuristic::GreedyDescent));
        ASSERT_TRUE(res.found);
        expect_well_formed(req, res);
        EXPECT_EQ(res.routes[0].nodes, std::vector<int>({0, 1, 2, 3, 4, 0}));
        EXPECT_DOUBLE_EQ(res.objective, 44.0);
        EXPECT_DOUBLE_EQ(res.objective, routes_cost(req.matrix, res.routes));
    }
}

TEST(LocalSearchOptimizer, LoadsNearIntMaxDoNotWrap) {
    int half = INT_MAX / 2 + 1;
    RoutingRequest req = line_request({0, 1, 2}, {half, half}, {INT_MAX});

    OptimizerResult res = LocalSearchOptimizer().solve(
        req, quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent));
    ASSERT_TRUE(res.found);
    expect_well_formed(req, res);
    EXPECT_FALSE(res.capacity_feasible);
    EXPECT_EQ(route_load(req, res.routes[0]), 2LL * half);

    SearchParameters strict = quick(FirstSolutionStrategy::PathCheapestArc, LocalSearchMetaheuristic::GreedyDescent);
    strict.allow_overflow = false;
    EXPECT_FALSE(LocalSearchOptimizer().solve(req, strict).found);
}
