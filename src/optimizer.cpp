#include "optimizer.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <limits>
#include <numeric>

using namespace std;
using Clock = chrono::steady_clock;
using ArcCost = function<double(int, int)>;

// Customers only; the depot is implicit at both ends of every route.
struct Plan {
    vector<vector<int>> routes;
    vector<long long> loads;
};

static long long trips_needed(long long load, int cap) {
    if (load <= 0) return 0;
    return (load + cap - 1) / cap;
}

// A route may take a customer if it does not need more trips than it already
// does (one trip for a route within capacity).
static bool can_take(long long load, int demand, int cap) {
    return trips_needed(load + demand, cap) <= max(1LL, trips_needed(load, cap));
}

static double path_cost(const vector<int> &r, int depot, const ArcCost &arc) {
    if (r.empty()) return 0.0;

    double cost = arc(depot, r.front());
    for (int i = 0; i < (int)r.size() - 1; i++)
        cost += arc(r[i], r[i + 1]);
    cost += arc(r.back(), depot);
    return cost;
}

static double plan_cost(const Plan &p, int depot, const ArcCost &arc) {
    double cost = 0.0;
    for (auto &r : p.routes) cost += path_cost(r, depot, arc);
    return cost;
}

static double insertion_delta(const vector<int> &r, int pos, int c, int depot, const ArcCost &arc) {
    int prev = (pos == 0) ? depot : r[pos - 1];
    int next = (pos == (int)r.size()) ? depot : r[pos];
    return arc(prev, c) + arc(c, next) - arc(prev, next);
}

bool validate_request(const RoutingRequest &req, string &error) {
    int n = req.matrix.size();
    if (req.num_vehicles <= 0) {
        error = "no vehicles";
        return false;
    }
    if ((int)req.capacities.size() != req.num_vehicles) {
        error = "capacity vector has " + to_string(req.capacities.size()) + " entries for " +
                to_string(req.num_vehicles) + " vehicles";
        return false;
    }
    for (int c : req.capacities) {
        if (c <= 0) {
            error = "vehicle capacity must be positive";
            return false;
        }
    }
    if ((int)req.demands.size() != n) {
        error = "demand vector has " + to_string(req.demands.size()) + " entries for " +
                to_string(n) + " nodes";
        return false;
    }
    for (auto &row : req.matrix) {
        if ((int)row.size() != n) {
            error = "distance matrix is not square";
            return false;
        }
    }
    for (int d : req.demands) {
        if (d < 0) {
            error = "negative demand";
            return false;
        }
    }
    if (req.depot < 0 || req.depot >= n) {
        error = "depot index out of range";
        return false;
    }
    return true;
}

// Each vehicle in turn extends from its last stop to the cheapest
// unassigned customer that still fits. Returns the customers left over.
static vector<int> path_cheapest_arc(const RoutingRequest &req, Plan &plan) {
    int n = req.demands.size();
    vector<bool> assigned(n, false);
    assigned[req.depot] = true;

    for (int v = 0; v < req.num_vehicles; v++) {
        int cur = req.depot;
        while (true) {
            double best = numeric_limits<double>::infinity();
            int best_node = -1;
            for (int c = 0; c < n; c++) {
                if (assigned[c]) continue;
                if (plan.loads[v] + req.demands[c] > req.capacities[v]) continue;
                if (req.matrix[cur][c] < best) {
                    best = req.matrix[cur][c];
                    best_node = c;
                }
            }
            if (best_node == -1) break;

            plan.routes[v].push_back(best_node);
            plan.loads[v] += req.demands[best_node];
            assigned[best_node] = true;
            cur = best_node;
        }
    }

    vector<int> leftover;
    for (int c = 0; c < n; c++)
        if (!assigned[c]) leftover.push_back(c);
    return leftover;
}

struct Saving {
    double value;
    int i, j;
};

// Clarke-Wright parallel savings. Merged routes are limited by the largest
// vehicle capacity, then handed to vehicles largest load first.
static vector<int> savings(const RoutingRequest &req, Plan &plan) {
    int n = req.demands.size();
    int depot = req.depot;
    int max_cap = *max_element(req.capacities.begin(), req.capacities.end());

    vector<int> leftover;
    vector<vector<int>> routes;
    vector<long long> loads;
    vector<int> route_of(n, -1);

    for (int c = 0; c < n; c++) {
        if (c == depot) continue;
        if (req.demands[c] > max_cap) {
            leftover.push_back(c);
            continue;
        }
        route_of[c] = routes.size();
        routes.push_back({c});
        loads.push_back(req.demands[c]);
    }

    vector<Saving> s;
    for (int i = 0; i < n; i++) {
        if (route_of[i] == -1) continue;
        for (int j = 0; j < n; j++) {
            if (i == j || route_of[j] == -1) continue;
            double value = req.matrix[i][depot] + req.matrix[depot][j] - req.matrix[i][j];
            if (value > 0) s.push_back({value, i, j});
        }
    }
    stable_sort(s.begin(), s.end(), [](const Saving &a, const Saving &b) {
        return a.value > b.value;
    });

    for (auto &sv : s) {
        int a = route_of[sv.i];
        int b = route_of[sv.j];
        if (a == b) continue;
        if (routes[a].back() != sv.i || routes[b].front() != sv.j) continue;
        if (loads[a] + loads[b] > max_cap) continue;

        for (int x : routes[b]) {
            routes[a].push_back(x);
            route_of[x] = a;
        }
        loads[a] += loads[b];
        routes[b].clear();
        loads[b] = 0;
    }

    vector<int> order;
    for (int r = 0; r < (int)routes.size(); r++)
        if (!routes[r].empty()) order.push_back(r);
    stable_sort(order.begin(), order.end(), [&](int a, int b) { return loads[a] > loads[b]; });

    vector<int> vehicles(req.num_vehicles);
    iota(vehicles.begin(), vehicles.end(), 0);
    stable_sort(vehicles.begin(), vehicles.end(), [&](int a, int b) {
        return req.capacities[a] > req.capacities[b];
    });

    for (int k = 0; k < (int)order.size(); k++) {
        int r = order[k];
        if (k < req.num_vehicles && loads[r] <= req.capacities[vehicles[k]]) {
            plan.routes[vehicles[k]] = routes[r];
            plan.loads[vehicles[k]] = loads[r];
        } else {
            leftover.insert(leftover.end(), routes[r].begin(), routes[r].end());
        }
    }
    sort(leftover.begin(), leftover.end());
    return leftover;
}

// Cheapest insertion within capacity first. With overflow allowed, a customer
// that fits nowhere goes to the route that then needs the fewest trips.
static void insert_leftovers(const RoutingRequest &req, Plan &plan, const vector<int> &leftover,
                             bool allow_overflow, vector<int> &unplaced)
{
    ArcCost arc = [&](int i, int j) { return req.matrix[i][j]; };
    const double INF = numeric_limits<double>::infinity();

    for (int c : leftover) {
        int d = req.demands[c];

        double best = INF;
        int best_v = -1, best_pos = -1;
        for (int v = 0; v < req.num_vehicles; v++) {
            if (plan.loads[v] + d > req.capacities[v]) continue;
            for (int p = 0; p <= (int)plan.routes[v].size(); p++) {
                double delta = insertion_delta(plan.routes[v], p, c, req.depot, arc);
                if (delta < best) {
                    best = delta;
                    best_v = v;
                    best_pos = p;
                }
            }
        }

        if (best_v == -1 && allow_overflow) {
            long long best_trips = numeric_limits<long long>::max();
            for (int v = 0; v < req.num_vehicles; v++) {
                long long trips = trips_needed(plan.loads[v] + d, req.capacities[v]);
                for (int p = 0; p <= (int)plan.routes[v].size(); p++) {
                    double delta = insertion_delta(plan.routes[v], p, c, req.depot, arc);
                    if (trips < best_trips || (trips == best_trips && delta < best)) {
                        best_trips = trips;
                        best = delta;
                        best_v = v;
                        best_pos = p;
                    }
                }
            }
        }

        if (best_v == -1) {
            unplaced.push_back(c);
            continue;
        }
        plan.routes[best_v].insert(plan.routes[best_v].begin() + best_pos, c);
        plan.loads[best_v] += d;
    }
}

// fwd[t] and bwd[t] are the costs of r[0..t] walked forwards and backwards,
// so reversing r[i..j] is priced from its two end arcs and two differences.
static void walk_costs(const vector<int> &r, const ArcCost &arc, vector<double> &fwd, vector<double> &bwd) {
    fwd.assign(r.size(), 0.0);
    bwd.assign(r.size(), 0.0);
    for (size_t t = 1; t < r.size(); t++) {
        fwd[t] = fwd[t - 1] + arc(r[t - 1], r[t]);
        bwd[t] = bwd[t - 1] + arc(r[t], r[t - 1]);
    }
}

static bool two_opt_pass(Plan &plan, int depot, const ArcCost &arc, Clock::time_point deadline) {
    bool improved_any = false;
    vector<double> fwd, bwd;

    for (auto &r : plan.routes) {
        int len = r.size();
        if (len < 2) continue;
        walk_costs(r, arc, fwd, bwd);

        bool improved = true;
        while (improved) {
            improved = false;

            for (int i = 0; i < len - 1; i++) {
                if (Clock::now() >= deadline) return improved_any;

                int prev = (i == 0) ? depot : r[i - 1];
                for (int j = i + 1; j < len; j++) {
                    int next = (j == len - 1) ? depot : r[j + 1];
                    double before = arc(prev, r[i]) + (fwd[j] - fwd[i]) + arc(r[j], next);
                    double after = arc(prev, r[j]) + (bwd[j] - bwd[i]) + arc(r[i], next);
                    if (after < before - 1e-9) {
                        reverse(r.begin() + i, r.begin() + j + 1);
                        walk_costs(r, arc, fwd, bwd);
                        improved = true;
                        improved_any = true;
                        if (Clock::now() >= deadline) return improved_any;
                    }
                }
            }
        }
    }
    return improved_any;
}

// Moves single customers between routes.
static bool relocate_pass(Plan &plan, const RoutingRequest &req, const ArcCost &arc,
                          Clock::time_point deadline)
{
    bool improved_any = false;
    int depot = req.depot;

    for (int a = 0; a < req.num_vehicles; a++) {
        int p = 0;
        while (p < (int)plan.routes[a].size()) {
            if (Clock::now() >= deadline) return improved_any;

            auto &ra = plan.routes[a];
            int c = ra[p];
            int d = req.demands[c];
            int prev = (p == 0) ? depot : ra[p - 1];
            int next = (p == (int)ra.size() - 1) ? depot : ra[p + 1];
            double removal = arc(prev, c) + arc(c, next) - arc(prev, next);

            double best_delta = -1e-9;
            int best_b = -1, best_q = -1;
            for (int b = 0; b < req.num_vehicles; b++) {
                if (b == a) continue;
                if (!can_take(plan.loads[b], d, req.capacities[b])) continue;

                for (int q = 0; q <= (int)plan.routes[b].size(); q++) {
                    double delta = insertion_delta(plan.routes[b], q, c, depot, arc) - removal;
                    if (delta < best_delta) {
                        best_delta = delta;
                        best_b = b;
                        best_q = q;
                    }
                }
            }

            if (best_b == -1) {
                p++;
                continue;
            }
            ra.erase(ra.begin() + p);
            plan.loads[a] -= d;
            plan.routes[best_b].insert(plan.routes[best_b].begin() + best_q, c);
            plan.loads[best_b] += d;
            improved_any = true;
        }
    }
    return improved_any;
}

static void local_search(Plan &plan, const RoutingRequest &req, const ArcCost &arc,
                         Clock::time_point deadline)
{
    bool improved = true;
    while (improved && Clock::now() < deadline) {
        improved = false;
        if (two_opt_pass(plan, req.depot, arc, deadline)) improved = true;
        if (relocate_pass(plan, req, arc, deadline)) improved = true;
    }
}

template <typename F>
static void for_each_arc(const Plan &plan, int depot, F fn) {
    for (auto &r : plan.routes) {
        if (r.empty()) continue;
        int prev = depot;
        for (int c : r) {
            fn(prev, c);
            prev = c;
        }
        fn(prev, depot);
    }
}

// Penalizes the arc of highest utility cost/(1+penalty) at every local
// optimum and searches again on the augmented cost. Stops at the deadline or
// after a long run without a new best.
static Plan guided_local_search(Plan plan, const RoutingRequest &req, Clock::time_point deadline) {
    int n = req.matrix.size();
    ArcCost real = [&](int i, int j) { return req.matrix[i][j]; };

    local_search(plan, req, real, deadline);
    Plan best = plan;
    double best_cost = plan_cost(best, req.depot, real);

    int arcs = 0;
    for_each_arc(plan, req.depot, [&](int, int) { arcs++; });
    if (arcs == 0 || best_cost <= 0) return best;

    vector<vector<int>> penalty(n, vector<int>(n, 0));
    double lambda = 0.1 * best_cost / arcs;
    ArcCost augmented = [&](int i, int j) { return req.matrix[i][j] + lambda * penalty[i][j]; };

    int stale = 0;
    int max_stale = 100 * max(1, n - 1);
    while (Clock::now() < deadline && stale < max_stale) {
        double best_util = -1.0;
        int bi = -1, bj = -1;
        for_each_arc(plan, req.depot, [&](int i, int j) {
            double util = req.matrix[i][j] / (1.0 + penalty[i][j]);
            if (util > best_util) {
                best_util = util;
                bi = i;
                bj = j;
            }
        });
        if (bi == -1) break;
        penalty[bi][bj]++;

        local_search(plan, req, augmented, deadline);

        double cost = plan_cost(plan, req.depot, real);
        if (cost < best_cost - 1e-9) {
            best = plan;
            best_cost = cost;
            stale = 0;
        } else {
            stale++;
        }
    }
    return best;
}

double routes_cost(const DistanceMatrix &m, const vector<VehicleRoute> &routes) {
    double cost = 0.0;
    for (auto &r : routes) cost += route_distance(m, r.nodes);
    return cost;
}

OptimizerResult LocalSearchOptimizer::solve(const RoutingRequest &req, const SearchParameters &params) {
    OptimizerResult res{false, false, {}, 0.0, ""};

    string error;
    if (!validate_request(req, error)) {
        res.message = "invalid routing request: " + error;
        return res;
    }

    auto deadline = Clock::now() + chrono::duration_cast<Clock::duration>(
                                       chrono::duration<double>(params.time_limit_seconds));

    Plan plan;
    plan.routes.assign(req.num_vehicles, {});
    plan.loads.assign(req.num_vehicles, 0);

    vector<int> leftover = (params.first_solution_strategy == FirstSolutionStrategy::Savings)
                               ? savings(req, plan)
                               : path_cheapest_arc(req, plan);

    vector<int> unplaced;
    insert_leftovers(req, plan, leftover, params.allow_overflow, unplaced);
    if (!unplaced.empty()) {
        long long demand = accumulate(req.demands.begin(), req.demands.end(), 0LL);
        long long capacity = accumulate(req.capacities.begin(), req.capacities.end(), 0LL);
        res.message = to_string(unplaced.size()) + " customers do not fit within vehicle capacity (" +
                      to_string(req.matrix.size()) + " locations, " + to_string(req.num_vehicles) +
                      " vehicles, total demand " + to_string(demand) + ", total capacity " +
                      to_string(capacity) + ")";
        return res;
    }

    if (params.metaheuristic == LocalSearchMetaheuristic::GuidedLocalSearch) {
        plan = guided_local_search(plan, req, deadline);
    } else {
        ArcCost real = [&](int i, int j) { return req.matrix[i][j]; };
        local_search(plan, req, real, deadline);
    }

    res.found = true;
    res.capacity_feasible = true;
    for (int v = 0; v < req.num_vehicles; v++) {
        if (plan.loads[v] > req.capacities[v]) res.capacity_feasible = false;

        VehicleRoute r;
        r.vehicle_id = v;
        r.nodes.push_back(req.depot);
        r.nodes.insert(r.nodes.end(), plan.routes[v].begin(), plan.routes[v].end());
        r.nodes.push_back(req.depot);
        res.routes.push_back(r);
    }
    res.objective = routes_cost(req.matrix, res.routes);
    return res;
}
