#pragma once
#include <string>
#include <vector>
#include "config.hpp"
#include "distance.hpp"
#include "instance.hpp"
#include "optimizer.hpp"

struct Stop {
    int node;
    long long load;    // vehicle load after this stop
    double distance;   // along the route from the depot to this stop
};

struct VehicleTrip {
    int vehicle_id;
    std::vector<Stop> stops;
    long long load;
    double distance;
};

struct RoundReport {
    int round;
    int remaining_before;
    std::vector<VehicleTrip> trips;   // vehicles with at least one stop
    std::vector<int> served;          // in the order they were served
    double distance;
};

enum class DispatchStatus { FullyServed, Stalled, NoSolutionFromOptimizer, InvalidRoutes };

enum class UnservedReason { DemandExceedsCapacity, NotRouted, NoProgress };

struct UnservedCustomer {
    int node;
    std::string name;
    int demand;
    UnservedReason reason;
};

struct DispatchResult {
    DispatchStatus status;
    std::vector<RoundReport> rounds;   // stalled rounds are not recorded
    int total_customers = 0;
    int served_count = 0;
    double total_distance = 0.0;
    long long total_demand = 0;
    long long total_capacity = 0;
    bool demand_exceeds_fleet_capacity = false;
    std::vector<UnservedCustomer> unserved;
    std::string message;

    int rounds_used() const { return (int)rounds.size(); }
    bool fully_served() const { return status == DispatchStatus::FullyServed; }
};

bool validate_routes(const ProblemInstance &inst, const std::vector<VehicleRoute> &routes,
                     std::string &error);

// Replays the fixed routes round after round until every customer is served
// or a round serves nobody.
DispatchResult dispatch_rounds(const ProblemInstance &inst, const DistanceMatrix &matrix,
                               const std::vector<VehicleRoute> &routes);

// Same, starting from an optimizer result; reports NoSolutionFromOptimizer
// when the optimizer found nothing.
DispatchResult dispatch(const ProblemInstance &inst, const DistanceMatrix &matrix,
                        const OptimizerResult &solved);

// Solves the remaining customers again before every round.
DispatchResult dispatch_reoptimizing(const ProblemInstance &inst, const DistanceMatrix &matrix,
                                     RouteOptimizer &optimizer, const SearchParameters &params);

struct SingleTripReport {
    std::vector<VehicleTrip> vehicles;   // every customer on the route, capacity ignored
    double total_distance;
    long long total_load;
};

// Routes must pass validate_routes.
SingleTripReport describe_single_trip(const ProblemInstance &inst, const DistanceMatrix &matrix,
                                      const std::vector<VehicleRoute> &routes);

RoutingRequest make_request(const ProblemInstance &inst, const DistanceMatrix &matrix);

const char *to_string(DispatchStatus s);
const char *to_string(UnservedReason r);
