#include "config.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
using namespace std;

const char *to_string(FirstSolutionStrategy s) {
    switch (s) {
        case FirstSolutionStrategy::PathCheapestArc: return "path_cheapest_arc";
        case FirstSolutionStrategy::Savings:         return "savings";
    }
    return "unknown";
}

const char *to_string(LocalSearchMetaheuristic m) {
    switch (m) {
        case LocalSearchMetaheuristic::GreedyDescent:     return "greedy_descent";
        case LocalSearchMetaheuristic::GuidedLocalSearch: return "guided_local_search";
    }
    return "unknown";
}

const char *to_string(DispatchMode m) {
    switch (m) {
        case DispatchMode::FixedRoute: return "fixed_route";
        case DispatchMode::Reoptimize: return "reoptimize";
    }
    return "unknown";
}

const char *to_string(DistanceSource s) {
    switch (s) {
        case DistanceSource::Osrm:      return "osrm";
        case DistanceSource::File:      return "file";
        case DistanceSource::Haversine: return "haversine";
    }
    return "unknown";
}

static bool parse_strategy(const string &s, FirstSolutionStrategy &out) {
    if (s == "path_cheapest_arc") { out = FirstSolutionStrategy::PathCheapestArc; return true; }
    if (s == "savings")           { out = FirstSolutionStrategy::Savings; return true; }
    return false;
}

static bool parse_metaheuristic(const string &s, LocalSearchMetaheuristic &out) {
    if (s == "greedy_descent")      { out = LocalSearchMetaheuristic::GreedyDescent; return true; }
    if (s == "guided_local_search") { out = LocalSearchMetaheuristic::GuidedLocalSearch; return true; }
    return false;
}

static bool parse_mode(const string &s, DispatchMode &out) {
    if (s == "fixed_route") { out = DispatchMode::FixedRoute; return true; }
    if (s == "reoptimize")  { out = DispatchMode::Reoptimize; return true; }
    return false;
}

static bool parse_source(const string &s, DistanceSource &out) {
    if (s == "osrm")      { out = DistanceSource::Osrm; return true; }
    if (s == "file")      { out = DistanceSource::File; return true; }
    if (s == "haversine") { out = DistanceSource::Haversine; return true; }
    return false;
}

vector<int> RunConfig::capacities() const {
    if (!vehicle_capacities.empty()) return vehicle_capacities;
    return vector<int>(max(num_vehicles, 0), vehicle_capacity);
}

bool parse_config(const json &j, RunConfig &cfg, string &error) {
    try {
        if (!j.is_object()) {
            error = "configuration must be a JSON object";
            return false;
        }

        if (j.contains("fleet")) {
            const auto &f = j["fleet"];
            cfg.num_vehicles = f.value("num_vehicles", cfg.num_vehicles);
            cfg.vehicle_capacity = f.value("vehicle_capacity", cfg.vehicle_capacity);
            if (f.contains("vehicle_capacities"))
                cfg.vehicle_capacities = f["vehicle_capacities"].get<vector<int>>();
        }

        cfg.demand_per_customer = j.value("demand_per_customer", cfg.demand_per_customer);

        if (j.contains("depot")) {
            cfg.depot.lon = j["depot"].value("lon", cfg.depot.lon);
            cfg.depot.lat = j["depot"].value("lat", cfg.depot.lat);
        }

        if (j.contains("service_area")) {
            const auto &a = j["service_area"];
            cfg.service_area.min_lat = a.value("min_lat", cfg.service_area.min_lat);
            cfg.service_area.max_lat = a.value("max_lat", cfg.service_area.max_lat);
            cfg.service_area.min_lon = a.value("min_lon", cfg.service_area.min_lon);
            cfg.service_area.max_lon = a.value("max_lon", cfg.service_area.max_lon);
        }

        if (j.contains("columns")) {
            const auto &c = j["columns"];
            cfg.columns.latitude = c.value("latitude", cfg.columns.latitude);
            cfg.columns.longitude = c.value("longitude", cfg.columns.longitude);
            cfg.columns.name = c.value("name", cfg.columns.name);
            cfg.columns.city = c.value("city", cfg.columns.city);
            cfg.columns.order_value = c.value("order_value", cfg.columns.order_value);
        }

        if (j.contains("distance")) {
            const auto &d = j["distance"];
            if (d.contains("provider") && !parse_source(d["provider"].get<string>(), cfg.distance.source)) {
                error = "unknown distance provider: " + d["provider"].get<string>();
                return false;
            }
            cfg.distance.osrm_url = d.value("osrm_url", cfg.distance.osrm_url);
            cfg.distance.file = d.value("file", cfg.distance.file);
            cfg.distance.timeout_seconds = d.value("timeout_seconds", cfg.distance.timeout_seconds);
        }

        if (j.contains("optimizer")) {
            const auto &o = j["optimizer"];
            if (o.contains("first_solution_strategy") &&
                !parse_strategy(o["first_solution_strategy"].get<string>(), cfg.search.first_solution_strategy)) {
                error = "unknown first_solution_strategy: " + o["first_solution_strategy"].get<string>();
                return false;
            }
            if (o.contains("local_search_metaheuristic") &&
                !parse_metaheuristic(o["local_search_metaheuristic"].get<string>(), cfg.search.metaheuristic)) {
                error = "unknown local_search_metaheuristic: " + o["local_search_metaheuristic"].get<string>();
                return false;
            }
            cfg.search.time_limit_seconds = o.value("time_limit_seconds", cfg.search.time_limit_seconds);
            cfg.search.allow_overflow = o.value("allow_overflow", cfg.search.allow_overflow);
        }

        if (j.contains("dispatch")) {
            const auto &d = j["dispatch"];
            if (d.contains("mode") && !parse_mode(d["mode"].get<string>(), cfg.mode)) {
                error = "unknown dispatch mode: " + d["mode"].get<string>();
                return false;
            }
        }
    } catch (const exception &e) {
        error = string("bad configuration value: ") + e.what();
        return false;
    }

    return validate_config(cfg, error);
}

bool validate_config(const RunConfig &cfg, string &error) {
    if (cfg.num_vehicles <= 0) {
        error = "num_vehicles must be positive";
        return false;
    }
    if (!cfg.vehicle_capacities.empty() &&
        (int)cfg.vehicle_capacities.size() != cfg.num_vehicles) {
        error = "vehicle_capacities has " + to_string(cfg.vehicle_capacities.size()) +
                " entries for " + to_string(cfg.num_vehicles) + " vehicles";
        return false;
    }
    for (int c : cfg.capacities()) {
        if (c <= 0) {
            error = "vehicle capacity must be positive";
            return false;
        }
    }
    if (cfg.demand_per_customer < 0) {
        error = "demand_per_customer must be non-negative";
        return false;
    }
    if (!in_legal_range(cfg.depot)) {
        error = "depot coordinate out of range";
        return false;
    }

    const auto &a = cfg.service_area;
    if (a.min_lat > a.max_lat || a.min_lon > a.max_lon) {
        error = "service_area is inverted";
        return false;
    }
    if (!in_legal_range({a.min_lon, a.min_lat}) || !in_legal_range({a.max_lon, a.max_lat})) {
        error = "service_area exceeds the legal latitude/longitude range";
        return false;
    }

    if (cfg.search.time_limit_seconds <= 0) {
        error = "time_limit_seconds must be positive";
        return false;
    }
    if (cfg.distance.source == DistanceSource::File && cfg.distance.file.empty()) {
        error = "distance provider 'file' needs distance.file";
        return false;
    }
    if (cfg.distance.timeout_seconds <= 0) {
        error = "timeout_seconds must be positive";
        return false;
    }
    return true;
}

bool load_config(const string &filename, RunConfig &cfg) {
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open config file: " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const exception &e) {
        cerr << "Error parsing config JSON: " << e.what() << "\n";
        return false;
    }

    string error;
    if (!parse_config(j, cfg, error)) {
        cerr << "Invalid configuration: " << error << "\n";
        return false;
    }
    return true;
}

json config_to_json(const RunConfig &cfg) {
    json j;
    j["fleet"] = {
        {"num_vehicles", cfg.num_vehicles},
        {"vehicle_capacities", cfg.capacities()}
    };
    j["demand_per_customer"] = cfg.demand_per_customer;
    j["depot"] = {{"lon", cfg.depot.lon}, {"lat", cfg.depot.lat}};
    j["service_area"] = {
        {"min_lat", cfg.service_area.min_lat}, {"max_lat", cfg.service_area.max_lat},
        {"min_lon", cfg.service_area.min_lon}, {"max_lon", cfg.service_area.max_lon}
    };
    j["distance"] = {{"provider", to_string(cfg.distance.source)}};
    j["optimizer"] = {
        {"first_solution_strategy", to_string(cfg.search.first_solution_strategy)},
        {"local_search_metaheuristic", to_string(cfg.search.metaheuristic)},
        {"time_limit_seconds", cfg.search.time_limit_seconds},
        {"allow_overflow", cfg.search.allow_overflow}
    };
    j["dispatch"] = {{"mode", to_string(cfg.mode)}};
    return j;
}
