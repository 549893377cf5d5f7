#include "report.hpp"
#include <iomanip>
#include <sstream>

using json = nlohmann::json;
using namespace std;

string format_km(double meters) {
    ostringstream ss;
    ss << fixed << setprecision(2) << meters / 1000.0 << " km";
    return ss.str();
}

string stop_label(const Node &n) {
    string label = display_name(n);
    label += " (" + (n.city.empty() ? string("Unknown") : n.city) + ")";
    return label;
}

void print_rejected(ostream &out, const vector<RejectedRecord> &rejected) {
    if (rejected.empty()) return;

    out << "Filtered out " << rejected.size() << " rows with invalid/distant coordinates:\n";
    for (auto &r : rejected) {
        out << "  Row " << r.record.row << ": " << r.record.latitude << ", " << r.record.longitude
            << " - " << (r.record.city.empty() ? "Unknown" : r.record.city) << " (" << r.reason << ")\n";
    }
}

void print_single_trip(ostream &out, const ProblemInstance &inst, const SingleTripReport &rep) {
    out << "\n=== SINGLE-TRIP SOLUTION (for reference) ===\n";
    for (auto &v : rep.vehicles) {
        out << "Route for Vehicle " << v.vehicle_id + 1 << ":\n";
        out << " -> DEPOT (Load: 0) ";
        for (auto &s : v.stops)
            out << " -> " << stop_label(inst.nodes[s.node]) << " (Load: " << s.load << ") ";
        out << " -> DEPOT\n";
        out << "Distance: " << format_km(v.distance) << ", Stops: " << v.stops.size() << "\n\n";
    }
    out << "Total distance: " << format_km(rep.total_distance) << "\n";
    out << "Total load: " << rep.total_load << "\n";
}

void print_round(ostream &out, const ProblemInstance &inst, const RoundReport &rep, int served_so_far) {
    out << "\n--- ROUND " << rep.round << " ---\n";
    out << "Customers remaining: " << rep.remaining_before << "\n";

    for (auto &t : rep.trips) {
        out << "\nVehicle " << t.vehicle_id + 1 << " - Round " << rep.round << ":\n";
        out << "  -> Start from DEPOT\n";
        int k = 0;
        for (auto &s : t.stops) {
            const Node &n = inst.nodes[s.node];
            out << "  -> Stop " << ++k << ": " << stop_label(n);
            if (!n.order_value.empty()) out << " - Order: " << n.order_value;
            out << "\n";
        }
        out << "  -> Return to DEPOT\n";
        out << "  Distance: " << format_km(t.distance) << ", Stops: " << t.stops.size()
            << ", Load: " << t.load << "\n";
    }

    out << "Round " << rep.round << " summary:\n";
    out << "  Customers served this round: " << rep.served.size() << "\n";
    out << "  Total customers served: " << served_so_far << "\n";
    out << "  Round distance: " << format_km(rep.distance) << "\n";
}

void print_summary(ostream &out, const DispatchResult &res) {
    out << "\n=== FINAL SUMMARY ===\n";
    if (res.status == DispatchStatus::NoSolutionFromOptimizer ||
        res.status == DispatchStatus::InvalidRoutes) {
        out << "Dispatch not possible: " << res.message << "\n";
    } else if (res.status == DispatchStatus::Stalled) {
        out << "WARNING: Could not serve any more customers. Check capacity constraints.\n";
    }

    out << "Total rounds needed: " << res.rounds_used() << "\n";
    out << "Customers served: " << res.served_count << " out of " << res.total_customers << "\n";
    out << "Total distance: " << format_km(res.total_distance) << "\n";

    if (!res.unserved.empty()) {
        out << "Unserved customers:\n";
        for (auto &u : res.unserved) {
            out << "  #" << u.node << " " << u.name << " (demand " << u.demand << "): "
                << to_string(u.reason) << "\n";
        }
    }
}

void print_dispatch(ostream &out, const ProblemInstance &inst, const DispatchResult &res) {
    out << "\n=== MULTI-TRIP DELIVERY SIMULATION ===\n";
    out << "Total customers to serve: " << res.total_customers << "\n";

    int served = 0;
    for (auto &r : res.rounds) {
        served += r.served.size();
        print_round(out, inst, r, served);
    }
    print_summary(out, res);
}

json trip_to_json(const ProblemInstance &inst, const VehicleTrip &trip) {
    json stops = json::array();
    for (auto &s : trip.stops) {
        const Node &n = inst.nodes[s.node];
        stops.push_back({
            {"node", s.node},
            {"name", display_name(n)},
            {"city", n.city},
            {"order_value", n.order_value},
            {"load", s.load},
            {"distance", s.distance}
        });
    }
    return {
        {"vehicle_id", trip.vehicle_id},
        {"stops", stops},
        {"load", trip.load},
        {"distance", trip.distance}
    };
}

json dispatch_to_json(const RunConfig &cfg, const BuildResult &built, const OptimizerResult &solved,
                      const SingleTripReport &single, const DispatchResult &res)
{
    const ProblemInstance &inst = built.instance;
    json out;
    out["config"] = config_to_json(cfg);

    json rejected = json::array();
    for (auto &r : built.rejected) {
        rejected.push_back({
            {"row", r.record.row},
            {"latitude", r.record.latitude},
            {"longitude", r.record.longitude},
            {"city", r.record.city},
            {"reason", r.reason}
        });
    }
    out["rejected"] = rejected;

    json routes = json::array();
    for (auto &r : solved.routes)
        routes.push_back({{"vehicle_id", r.vehicle_id}, {"nodes", r.nodes}});
    out["single_trip"] = {
        {"found", solved.found},
        {"capacity_feasible", solved.capacity_feasible},
        {"objective", solved.objective},
        {"routes", routes},
        {"total_distance", single.total_distance},
        {"total_load", single.total_load}
    };

    json rounds = json::array();
    for (auto &r : res.rounds) {
        json trips = json::array();
        for (auto &t : r.trips) trips.push_back(trip_to_json(inst, t));
        rounds.push_back({
            {"round", r.round},
            {"remaining_before", r.remaining_before},
            {"served", r.served},
            {"distance", r.distance},
            {"vehicles", trips}
        });
    }
    out["rounds"] = rounds;

    json unserved = json::array();
    for (auto &u : res.unserved) {
        unserved.push_back({
            {"node", u.node},
            {"name", u.name},
            {"demand", u.demand},
            {"reason", to_string(u.reason)}
        });
    }

    out["summary"] = {
        {"status", to_string(res.status)},
        {"rounds_used", res.rounds_used()},
        {"customers_served", res.served_count},
        {"total_customers", res.total_customers},
        {"total_distance", res.total_distance},
        {"total_demand", res.total_demand},
        {"total_capacity", res.total_capacity},
        {"demand_exceeds_fleet_capacity", res.demand_exceeds_fleet_capacity},
        {"unserved", unserved},
        {"message", res.message}
    };
    return out;
}

string document_text(const json &doc) {
    return doc.dump(2, ' ', false, json::error_handler_t::replace);
}
