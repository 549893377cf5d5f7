#pragma once
#include <string>
#include <vector>
#include "config.hpp"
#include "distance.hpp"

struct RoutingRequest {
    DistanceMatrix matrix;
    int num_vehicles;
    std::vector<int> capacities;   // one per vehicle
    std::vector<int> demands;      // one per node, depot included
    int depot = 0;
};

// Starts and ends at the depot.
struct VehicleRoute {
    int vehicle_id;
    std::vector<int> nodes;
};

struct OptimizerResult {
    bool found;
    bool capacity_feasible;     // false when overflow placed customers past capacity
    std::vector<VehicleRoute> routes;
    double objective;
    std::string message;
};

class RouteOptimizer {
public:
    virtual ~RouteOptimizer() = default;
    virtual OptimizerResult solve(const RoutingRequest &req, const SearchParameters &params) = 0;
};

// Construction heuristic followed by local search, bounded by
// params.time_limit_seconds.
class LocalSearchOptimizer : public RouteOptimizer {
public:
    OptimizerResult solve(const RoutingRequest &req, const SearchParameters &params) override;
};

bool validate_request(const RoutingRequest &req, std::string &error);

double routes_cost(const DistanceMatrix &m, const std::vector<VehicleRoute> &routes);
