#pragma once
#include <string>
#include <utility>
#include <vector>
#include "geo.hpp"
#include "nlohmann/json.hpp"

using DistanceMatrix = std::vector<std::vector<double>>;

struct MatrixResult {
    bool ok;
    DistanceMatrix matrix;
    std::string error;
};

class DistanceProvider {
public:
    virtual ~DistanceProvider() = default;
    // locations[0] is the depot.
    virtual MatrixResult fetch(const std::vector<Coordinate> &locations) = 0;
};

class HaversineProvider : public DistanceProvider {
public:
    MatrixResult fetch(const std::vector<Coordinate> &locations) override;
};

// Reads a table-service response saved to disk.
class TableFileProvider : public DistanceProvider {
public:
    explicit TableFileProvider(std::string filename) : filename_(std::move(filename)) {}
    MatrixResult fetch(const std::vector<Coordinate> &locations) override;

private:
    std::string filename_;
};

std::string build_table_url(const std::string &base_url, const std::vector<Coordinate> &locations);

MatrixResult parse_table_response(const nlohmann::json &response, size_t expected_size);

// Square, expected size, finite non-negative entries, zero diagonal.
bool validate_matrix(const DistanceMatrix &m, size_t expected_size, std::string &error);

double route_distance(const DistanceMatrix &m, const std::vector<int> &route);
