#include "instance.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cerrno>

using namespace std;

static bool parse_real(const string &text, double &out) {
    size_t b = text.find_first_not_of(" \t");
    if (b == string::npos) return false;
    size_t e = text.find_last_not_of(" \t");
    string s = text.substr(b, e - b + 1);

    char *end = nullptr;
    errno = 0;
    double v = strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

string check_record(const CustomerRecord &r, const BoundingBox &area, Coordinate &out) {
    double lat, lon;
    if (!parse_real(r.latitude, lat) || !parse_real(r.longitude, lon))
        return "unparseable coordinate";

    Coordinate c{lon, lat};
    if (!in_legal_range(c))
        return "coordinate out of range";
    if (!area.contains(c))
        return "outside service area";

    out = c;
    return "";
}

BuildResult build_instance(const vector<CustomerRecord> &records, const RunConfig &cfg) {
    BuildResult res;
    res.status = BuildStatus::Ok;

    Node depot;
    depot.id = 0;
    depot.coord = cfg.depot;
    depot.demand = 0;
    depot.name = "DEPOT";
    depot.source_row = -1;
    res.instance.nodes.push_back(depot);

    for (const auto &r : records) {
        Coordinate c{0.0, 0.0};
        string reason = check_record(r, cfg.service_area, c);
        if (!reason.empty()) {
            res.rejected.push_back({r, reason});
            continue;
        }

        Node n;
        n.id = (int)res.instance.nodes.size();
        n.coord = c;
        n.demand = cfg.demand_per_customer;
        n.name = r.name;
        n.city = r.city;
        n.order_value = r.order_value;
        n.source_row = r.row;
        res.instance.nodes.push_back(n);
    }

    vector<int> caps = cfg.capacities();
    for (int v = 0; v < (int)caps.size(); v++)
        res.instance.vehicles.push_back({v, caps[v]});

    if (res.instance.num_customers() == 0) {
        res.status = BuildStatus::EmptyInstance;
        res.message = "no valid customers remain after filtering " +
                      to_string(records.size()) + " records";
    }
    return res;
}

vector<int> ProblemInstance::demands() const {
    vector<int> d;
    d.reserve(nodes.size());
    for (const auto &n : nodes) d.push_back(n.demand);
    return d;
}

vector<int> ProblemInstance::capacities() const {
    vector<int> c;
    c.reserve(vehicles.size());
    for (const auto &v : vehicles) c.push_back(v.capacity);
    return c;
}

vector<Coordinate> ProblemInstance::coordinates() const {
    vector<Coordinate> c;
    c.reserve(nodes.size());
    for (const auto &n : nodes) c.push_back(n.coord);
    return c;
}

long long total_demand(const ProblemInstance &inst) {
    long long s = 0;
    for (const auto &n : inst.nodes) s += n.demand;
    return s;
}

long long total_capacity(const ProblemInstance &inst) {
    long long s = 0;
    for (const auto &v : inst.vehicles) s += v.capacity;
    return s;
}

int max_capacity(const ProblemInstance &inst) {
    int m = 0;
    for (const auto &v : inst.vehicles) m = max(m, v.capacity);
    return m;
}

vector<string> location_strings(const ProblemInstance &inst) {
    vector<string> out;
    out.reserve(inst.nodes.size());
    for (const auto &n : inst.nodes) out.push_back(to_lonlat_string(n.coord));
    return out;
}

string display_name(const Node &n) {
    if (n.id == 0) return "DEPOT";
    if (!n.name.empty()) return n.name;
    return "Customer " + to_string(n.id);
}
