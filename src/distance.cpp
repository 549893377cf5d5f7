#include "distance.hpp"
#include <cmath>
#include <fstream>

using json = nlohmann::json;
using namespace std;

MatrixResult HaversineProvider::fetch(const vector<Coordinate> &locations) {
    size_t n = locations.size();
    MatrixResult res{true, DistanceMatrix(n, vector<double>(n, 0.0)), ""};
    for (size_t i = 0; i < n; i++)
        for (size_t j = 0; j < n; j++)
            if (i != j) res.matrix[i][j] = haversine_m(locations[i], locations[j]);
    return res;
}

MatrixResult TableFileProvider::fetch(const vector<Coordinate> &locations) {
    ifstream fin(filename_);
    if (!fin)
        return {false, {}, "could not open distance table file: " + filename_};

    json j;
    try {
        fin >> j;
    } catch (const exception &e) {
        return {false, {}, string("error parsing distance table JSON: ") + e.what()};
    }
    return parse_table_response(j, locations.size());
}

string build_table_url(const string &base_url, const vector<Coordinate> &locations) {
    string url = base_url;
    for (size_t i = 0; i < locations.size(); i++) {
        if (i) url += ";";
        url += to_lonlat_string(locations[i]);
    }
    url += "?annotations=distance";
    return url;
}

MatrixResult parse_table_response(const json &response, size_t expected_size) {
    MatrixResult res{false, {}, ""};

    if (!response.is_object() || !response.contains("distances")) {
        res.error = "no distances in response: " + response.dump();
        return res;
    }

    const auto &rows = response["distances"];
    if (!rows.is_array()) {
        res.error = "distances is not an array";
        return res;
    }

    for (size_t i = 0; i < rows.size(); i++) {
        if (!rows[i].is_array()) {
            res.error = "distances row " + to_string(i) + " is not an array";
            return res;
        }
        vector<double> row;
        row.reserve(rows[i].size());
        for (size_t k = 0; k < rows[i].size(); k++) {
            const auto &v = rows[i][k];
            if (v.is_null()) {
                res.error = "no route between locations " + to_string(i) + " and " + to_string(k);
                return res;
            }
            if (!v.is_number()) {
                res.error = "non-numeric distance at " + to_string(i) + "," + to_string(k);
                return res;
            }
            row.push_back(v.get<double>());
        }
        res.matrix.push_back(row);
    }

    if (!validate_matrix(res.matrix, expected_size, res.error)) {
        res.matrix.clear();
        return res;
    }
    res.ok = true;
    return res;
}

bool validate_matrix(const DistanceMatrix &m, size_t expected_size, string &error) {
    if (m.size() != expected_size) {
        error = "distance matrix has " + to_string(m.size()) + " rows, expected " +
                to_string(expected_size);
        return false;
    }
    for (size_t i = 0; i < m.size(); i++) {
        if (m[i].size() != expected_size) {
            error = "distance matrix row " + to_string(i) + " has " +
                    to_string(m[i].size()) + " entries, expected " + to_string(expected_size);
            return false;
        }
        for (size_t j = 0; j < m[i].size(); j++) {
            if (!std::isfinite(m[i][j]) || m[i][j] < 0) {
                error = "invalid distance at " + to_string(i) + "," + to_string(j);
                return false;
            }
        }
        if (m[i][i] != 0.0) {
            error = "non-zero diagonal at " + to_string(i);
            return false;
        }
    }
    return true;
}

double route_distance(const DistanceMatrix &m, const vector<int> &route) {
    if (route.size() <= 1) return 0.0;

    double cost = 0.0;
    for (int i = 0; i < (int)route.size() - 1; i++)
        cost += m[route[i]][route[i + 1]];
    return cost;
}
