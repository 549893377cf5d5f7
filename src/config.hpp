#pragma once
#include <string>
#include <vector>
#include "geo.hpp"
#include "nlohmann/json.hpp"

enum class FirstSolutionStrategy { PathCheapestArc, Savings };
enum class LocalSearchMetaheuristic { GreedyDescent, GuidedLocalSearch };
enum class DispatchMode { FixedRoute, Reoptimize };
enum class DistanceSource { Osrm, File, Haversine };

struct SearchParameters {
    FirstSolutionStrategy first_solution_strategy = FirstSolutionStrategy::PathCheapestArc;
    LocalSearchMetaheuristic metaheuristic = LocalSearchMetaheuristic::GuidedLocalSearch;
    double time_limit_seconds = 60.0;
    bool allow_overflow = true;   // place customers past capacity, to be deferred to later rounds
};

struct ColumnMap {
    std::string latitude = "Latitide";
    std::string longitude = "Longitude";
    std::string name = "Customer Name";
    std::string city = "City";
    std::string order_value = "Order Value";
};

struct DistanceSettings {
    DistanceSource source = DistanceSource::Osrm;
    std::string osrm_url = "http://localhost:5001/table/v1/driving/";
    std::string file;
    int timeout_seconds = 30;
};

struct RunConfig {
    int num_vehicles = 5;
    int vehicle_capacity = 50;
    std::vector<int> vehicle_capacities;   // empty: uniform vehicle_capacity
    int demand_per_customer = 3;
    Coordinate depot{77.5946, 12.9716};
    BoundingBox service_area{12.5, 13.5, 77.0, 78.0};
    ColumnMap columns;
    DistanceSettings distance;
    SearchParameters search;
    DispatchMode mode = DispatchMode::FixedRoute;

    std::vector<int> capacities() const;
};

bool parse_config(const nlohmann::json &j, RunConfig &cfg, std::string &error);
bool validate_config(const RunConfig &cfg, std::string &error);
bool load_config(const std::string &filename, RunConfig &cfg);

nlohmann::json config_to_json(const RunConfig &cfg);

const char *to_string(FirstSolutionStrategy s);
const char *to_string(LocalSearchMetaheuristic m);
const char *to_string(DispatchMode m);
const char *to_string(DistanceSource s);
