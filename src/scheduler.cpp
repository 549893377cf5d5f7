#include "scheduler.hpp"
#include <algorithm>
#include <iostream>

using namespace std;

const char *to_string(DispatchStatus s) {
    switch (s) {
        case DispatchStatus::FullyServed:             return "fully_served";
        case DispatchStatus::Stalled:                 return "stalled";
        case DispatchStatus::NoSolutionFromOptimizer: return "no_solution_from_optimizer";
        case DispatchStatus::InvalidRoutes:           return "invalid_routes";
    }
    return "unknown";
}

const char *to_string(UnservedReason r) {
    switch (r) {
        case UnservedReason::DemandExceedsCapacity: return "demand exceeds capacity";
        case UnservedReason::NotRouted:             return "not routed";
        case UnservedReason::NoProgress:            return "no progress";
    }
    return "unknown";
}

RoutingRequest make_request(const ProblemInstance &inst, const DistanceMatrix &matrix) {
    RoutingRequest req;
    req.matrix = matrix;
    req.num_vehicles = inst.vehicles.size();
    req.capacities = inst.capacities();
    req.demands = inst.demands();
    req.depot = 0;
    return req;
}

bool validate_routes(const ProblemInstance &inst, const vector<VehicleRoute> &routes, string &error) {
    int n = inst.nodes.size();
    int v = inst.vehicles.size();
    vector<bool> seen(v, false);

    for (auto &r : routes) {
        if (r.vehicle_id < 0 || r.vehicle_id >= v) {
            error = "route for unknown vehicle " + to_string(r.vehicle_id);
            return false;
        }
        if (seen[r.vehicle_id]) {
            error = "two routes for vehicle " + to_string(r.vehicle_id);
            return false;
        }
        seen[r.vehicle_id] = true;

        if (r.nodes.size() < 2 || r.nodes.front() != 0 || r.nodes.back() != 0) {
            error = "route of vehicle " + to_string(r.vehicle_id) + " does not start and end at the depot";
            return false;
        }
        for (int node : r.nodes) {
            if (node < 0 || node >= n) {
                error = "route of vehicle " + to_string(r.vehicle_id) + " visits unknown node " +
                        to_string(node);
                return false;
            }
        }
    }
    return true;
}

static vector<VehicleRoute> by_vehicle(vector<VehicleRoute> routes) {
    sort(routes.begin(), routes.end(), [](const VehicleRoute &a, const VehicleRoute &b) {
        return a.vehicle_id < b.vehicle_id;
    });
    return routes;
}

// One pass over every vehicle's route. A customer is taken if nobody has
// served it yet and it still fits in this vehicle's load for the round.
static RoundReport run_round(const ProblemInstance &inst, const DistanceMatrix &m,
                             const vector<VehicleRoute> &routes, const vector<bool> &served, int round)
{
    RoundReport rep;
    rep.round = round;
    rep.remaining_before = 0;
    rep.distance = 0.0;
    for (int c = 1; c < (int)inst.nodes.size(); c++)
        if (!served[c]) rep.remaining_before++;

    vector<bool> taken(inst.nodes.size(), false);

    for (auto &route : routes) {
        int cap = inst.vehicles[route.vehicle_id].capacity;
        VehicleTrip trip{route.vehicle_id, {}, 0, 0.0};

        double along = 0.0;
        for (int k = 0; k < (int)route.nodes.size(); k++) {
            int node = route.nodes[k];
            if (k > 0) along += m[route.nodes[k - 1]][node];

            if (node == 0) continue;
            if (served[node] || taken[node]) continue;

            int d = inst.nodes[node].demand;
            if (d > cap - trip.load) continue;

            trip.load += d;
            taken[node] = true;
            trip.stops.push_back({node, trip.load, along});
            rep.served.push_back(node);
        }

        if (!trip.stops.empty()) {
            trip.distance = along;
            rep.distance += along;
            rep.trips.push_back(trip);
        }
    }
    return rep;
}

static DispatchResult start_result(const ProblemInstance &inst) {
    DispatchResult res;
    res.status = DispatchStatus::FullyServed;
    res.total_customers = inst.num_customers();
    res.total_demand = total_demand(inst);
    res.total_capacity = total_capacity(inst);
    res.demand_exceeds_fleet_capacity = res.total_demand > res.total_capacity;

    if (res.demand_exceeds_fleet_capacity) {
        cerr << "WARNING: Total demand " << res.total_demand << " exceeds total fleet capacity "
             << res.total_capacity << "; customers will be served over several rounds\n";
    }
    return res;
}

static UnservedReason classify(const ProblemInstance &inst, int node, const vector<int> &carriers) {
    int d = inst.nodes[node].demand;
    if (carriers.empty()) {
        if (d > max_capacity(inst)) return UnservedReason::DemandExceedsCapacity;
        return UnservedReason::NotRouted;
    }
    for (int v : carriers)
        if (d <= inst.vehicles[v].capacity) return UnservedReason::NoProgress;
    return UnservedReason::DemandExceedsCapacity;
}

static vector<vector<int>> carriers_of(const ProblemInstance &inst, const vector<VehicleRoute> &routes) {
    vector<vector<int>> carriers(inst.nodes.size());
    for (auto &r : routes) {
        for (int node : r.nodes) {
            if (node <= 0 || node >= (int)inst.nodes.size()) continue;
            auto &c = carriers[node];
            if (find(c.begin(), c.end(), r.vehicle_id) == c.end()) c.push_back(r.vehicle_id);
        }
    }
    return carriers;
}

static void finish(DispatchResult &res, const ProblemInstance &inst, const vector<bool> &served,
                   const vector<vector<int>> &carriers)
{
    res.served_count = 0;
    res.unserved.clear();
    for (int c = 1; c < (int)inst.nodes.size(); c++) {
        if (served[c]) {
            res.served_count++;
            continue;
        }
        const Node &n = inst.nodes[c];
        res.unserved.push_back({c, display_name(n), n.demand, classify(inst, c, carriers[c])});
    }

    res.total_distance = 0.0;
    for (auto &r : res.rounds) res.total_distance += r.distance;

    if (res.status == DispatchStatus::FullyServed && res.served_count < res.total_customers)
        res.status = DispatchStatus::Stalled;
}

static string stall_message(int round, int unserved) {
    return "round " + to_string(round) + " served no customers; " + to_string(unserved) +
           " customers remain unserved";
}

DispatchResult dispatch_rounds(const ProblemInstance &inst, const DistanceMatrix &matrix,
                               const vector<VehicleRoute> &routes)
{
    DispatchResult res = start_result(inst);
    vector<bool> served(inst.nodes.size(), false);

    string error;
    if (!validate_routes(inst, routes, error)) {
        res.status = DispatchStatus::InvalidRoutes;
        res.message = error;
        finish(res, inst, served, vector<vector<int>>(inst.nodes.size()));
        return res;
    }

    auto ordered = by_vehicle(routes);
    auto carriers = carriers_of(inst, ordered);

    int served_count = 0;
    int round = 1;
    while (served_count < res.total_customers) {
        RoundReport rep = run_round(inst, matrix, ordered, served, round);
        if (rep.served.empty()) {
            res.status = DispatchStatus::Stalled;
            res.message = stall_message(round, res.total_customers - served_count);
            break;
        }

        for (int node : rep.served) served[node] = true;
        served_count += rep.served.size();
        res.rounds.push_back(rep);
        round++;
    }

    finish(res, inst, served, carriers);
    return res;
}

DispatchResult dispatch(const ProblemInstance &inst, const DistanceMatrix &matrix,
                        const OptimizerResult &solved)
{
    if (solved.found) return dispatch_rounds(inst, matrix, solved.routes);

    DispatchResult res = start_result(inst);
    res.status = DispatchStatus::NoSolutionFromOptimizer;
    res.message = "no solution from optimizer: " + solved.message + " (locations " +
                  to_string(inst.nodes.size()) + ", vehicles " + to_string(inst.vehicles.size()) +
                  ", max capacity " + to_string(max_capacity(inst)) + ", total demand " +
                  to_string(res.total_demand) + ")";
    vector<bool> served(inst.nodes.size(), false);
    finish(res, inst, served, vector<vector<int>>(inst.nodes.size()));
    return res;
}

DispatchResult dispatch_reoptimizing(const ProblemInstance &inst, const DistanceMatrix &matrix,
                                     RouteOptimizer &optimizer, const SearchParameters &params)
{
    DispatchResult res = start_result(inst);
    int n = inst.nodes.size();
    int max_cap = max_capacity(inst);
    vector<bool> served(n, false);
    vector<vector<int>> carriers(n);

    // every round only takes what fits, so the sub-solve may overflow
    SearchParameters round_params = params;
    round_params.allow_overflow = true;

    int served_count = 0;
    int round = 1;
    while (served_count < res.total_customers) {
        vector<int> ids = {0};
        for (int c = 1; c < n; c++)
            if (!served[c] && inst.nodes[c].demand <= max_cap) ids.push_back(c);

        if (ids.size() == 1) {
            res.status = DispatchStatus::Stalled;
            res.message = stall_message(round, res.total_customers - served_count);
            break;
        }

        RoutingRequest req;
        req.num_vehicles = inst.vehicles.size();
        req.capacities = inst.capacities();
        req.depot = 0;
        req.matrix.assign(ids.size(), vector<double>(ids.size(), 0.0));
        for (int i = 0; i < (int)ids.size(); i++) {
            req.demands.push_back(inst.nodes[ids[i]].demand);
            for (int j = 0; j < (int)ids.size(); j++)
                req.matrix[i][j] = matrix[ids[i]][ids[j]];
        }

        OptimizerResult sol = optimizer.solve(req, round_params);
        if (!sol.found) {
            res.status = DispatchStatus::NoSolutionFromOptimizer;
            res.message = "no solution from optimizer in round " + to_string(round) + ": " +
                          sol.message + " (locations " + to_string(ids.size()) + ", vehicles " +
                          to_string(req.num_vehicles) + ", max capacity " + to_string(max_cap) + ")";
            break;
        }

        vector<VehicleRoute> routes;
        for (auto &r : sol.routes) {
            VehicleRoute mapped{r.vehicle_id, {}};
            for (int k : r.nodes) {
                if (k < 0 || k >= (int)ids.size()) {
                    res.status = DispatchStatus::InvalidRoutes;
                    res.message = "optimizer returned unknown node " + to_string(k) + " in round " +
                                  to_string(round);
                    finish(res, inst, served, carriers);
                    return res;
                }
                mapped.nodes.push_back(ids[k]);
            }
            routes.push_back(mapped);
        }

        string error;
        if (!validate_routes(inst, routes, error)) {
            res.status = DispatchStatus::InvalidRoutes;
            res.message = error;
            break;
        }

        auto ordered = by_vehicle(routes);
        carriers = carriers_of(inst, ordered);

        RoundReport rep = run_round(inst, matrix, ordered, served, round);
        if (rep.served.empty()) {
            res.status = DispatchStatus::Stalled;
            res.message = stall_message(round, res.total_customers - served_count);
            break;
        }

        for (int node : rep.served) served[node] = true;
        served_count += rep.served.size();
        res.rounds.push_back(rep);
        round++;
    }

    finish(res, inst, served, carriers);
    return res;
}

SingleTripReport describe_single_trip(const ProblemInstance &inst, const DistanceMatrix &matrix,
                                      const vector<VehicleRoute> &routes)
{
    SingleTripReport rep{{}, 0.0, 0};

    for (auto &route : by_vehicle(routes)) {
        VehicleTrip trip{route.vehicle_id, {}, 0, 0.0};
        double along = 0.0;
        for (int k = 0; k < (int)route.nodes.size(); k++) {
            int node = route.nodes[k];
            if (k > 0) along += matrix[route.nodes[k - 1]][node];
            if (node == 0) continue;

            trip.load += inst.nodes[node].demand;
            trip.stops.push_back({node, trip.load, along});
        }
        trip.distance = along;

        rep.total_distance += along;
        rep.total_load += trip.load;
        if (!trip.stops.empty()) rep.vehicles.push_back(trip);
    }
    return rep;
}
