#pragma once
#include <string>
#include <vector>
#include "config.hpp"
#include "customers.hpp"
#include "geo.hpp"

struct Node {
    int id;              // 0 is the depot
    Coordinate coord;
    int demand;
    std::string name;
    std::string city;
    std::string order_value;
    int source_row;      // -1 for the depot
};

struct Vehicle {
    int id;
    int capacity;
};

struct ProblemInstance {
    std::vector<Node> nodes;        // nodes[i].id == i
    std::vector<Vehicle> vehicles;

    int num_customers() const { return (int)nodes.size() - 1; }
    std::vector<int> demands() const;
    std::vector<int> capacities() const;
    std::vector<Coordinate> coordinates() const;
};

struct RejectedRecord {
    CustomerRecord record;
    std::string reason;
};

enum class BuildStatus { Ok, EmptyInstance };

struct BuildResult {
    BuildStatus status;
    ProblemInstance instance;
    std::vector<RejectedRecord> rejected;
    std::string message;

    bool ok() const { return status == BuildStatus::Ok; }
};

// Empty string when the record is usable, otherwise the reason it is not.
std::string check_record(const CustomerRecord &r, const BoundingBox &area, Coordinate &out);

BuildResult build_instance(const std::vector<CustomerRecord> &records, const RunConfig &cfg);

long long total_demand(const ProblemInstance &inst);
long long total_capacity(const ProblemInstance &inst);
int max_capacity(const ProblemInstance &inst);

std::vector<std::string> location_strings(const ProblemInstance &inst);

std::string display_name(const Node &n);
