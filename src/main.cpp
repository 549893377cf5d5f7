#include <iostream>
#include <fstream>
#include <memory>
#include <vector>
#include <string>
#include <chrono>
#include "config.hpp"
#include "customers.hpp"
#include "instance.hpp"
#include "distance.hpp"
#include "osrm_client.hpp"
#include "optimizer.hpp"
#include "scheduler.hpp"
#include "report.hpp"
#include "nlohmann/json.hpp"

using namespace std;
using json = nlohmann::json;

static unique_ptr<DistanceProvider> make_provider(const DistanceSettings &s) {
    switch (s.source) {
        case DistanceSource::File:
            return make_unique<TableFileProvider>(s.file);
        case DistanceSource::Haversine:
            return make_unique<HaversineProvider>();
        case DistanceSource::Osrm:
            break;
    }
    return make_unique<OsrmProvider>(s.osrm_url, s.timeout_seconds);
}

int main(int argc, char** argv) {
    if (argc != 4) {
        cerr << "Usage: " << argv[0] << " <config.json> <customers.csv> <output.json>\n";
        return 1;
    }

    RunConfig cfg;
    if (!load_config(argv[1], cfg)) {
        cerr << "Failed to load configuration from " << argv[1] << "\n";
        return 1;
    }

    vector<CustomerRecord> records;
    if (!load_customers_csv(argv[2], cfg.columns, records)) {
        cerr << "Failed to load customers from " << argv[2] << "\n";
        return 1;
    }
    cout << "Loaded " << records.size() << " customer records\n";

    BuildResult built = build_instance(records, cfg);
    print_rejected(cout, built.rejected);
    if (!built.ok()) {
        cerr << "Error: " << built.message << "\n";
        return 1;
    }

    const ProblemInstance &inst = built.instance;
    cout << "After filtering invalid/distant coordinates: " << inst.num_customers() << " customers\n";
    cout << "Total locations: " << inst.nodes.size() << "\n";

    auto provider = make_provider(cfg.distance);
    MatrixResult mr = provider->fetch(inst.coordinates());
    if (!mr.ok) {
        cerr << "Error getting distance matrix (" << to_string(cfg.distance.source) << ", "
             << inst.nodes.size() << " locations): " << mr.error << "\n";
        return 1;
    }
    cout << "Distance matrix size: " << mr.matrix.size() << "x" << mr.matrix.size() << "\n";

    cout << "Total demand: " << total_demand(inst) << "\n";
    cout << "Total capacity: " << total_capacity(inst) << "\n";
    if (total_demand(inst) > total_capacity(inst)) {
        cout << "WARNING: Total demand exceeds total capacity!\n";
        cout << "Customers that do not fit will be deferred to later rounds\n";
    }

    LocalSearchOptimizer optimizer;
    RoutingRequest req = make_request(inst, mr.matrix);

    cout << "Starting optimization (" << to_string(cfg.search.first_solution_strategy) << ", "
         << to_string(cfg.search.metaheuristic) << ", " << cfg.search.time_limit_seconds << " s)...\n";
    auto start_time = chrono::steady_clock::now();
    OptimizerResult solved = optimizer.solve(req, cfg.search);
    auto end_time = chrono::steady_clock::now();
    cout << "Optimization completed in "
         << chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count() << " ms\n";

    SingleTripReport single{{}, 0.0, 0};
    DispatchResult res;
    if (!solved.found) {
        cerr << "No solution found!\n";
        cerr << "Debug info:\n";
        cerr << "Number of locations: " << inst.nodes.size() << "\n";
        cerr << "Number of vehicles: " << inst.vehicles.size() << "\n";
        cerr << "Vehicle capacity: " << max_capacity(inst) << "\n";
        cerr << "Total demand: " << total_demand(inst) << "\n";
        res = dispatch(inst, mr.matrix, solved);
    } else {
        if (!solved.capacity_feasible)
            cout << "Single-trip solution exceeds capacity; the excess is handled in later rounds\n";

        string error;
        if (!validate_routes(inst, solved.routes, error)) {
            cerr << "Optimizer returned invalid routes: " << error << "\n";
            return 1;
        }
        single = describe_single_trip(inst, mr.matrix, solved.routes);
        print_single_trip(cout, inst, single);

        if (cfg.mode == DispatchMode::Reoptimize)
            res = dispatch_reoptimizing(inst, mr.matrix, optimizer, cfg.search);
        else
            res = dispatch(inst, mr.matrix, solved);
    }

    print_dispatch(cout, inst, res);

    json out = dispatch_to_json(cfg, built, solved, single, res);
    ofstream out_file(argv[3]);
    if (!out_file) {
        cerr << "Failed to open output file " << argv[3] << "\n";
        return 1;
    }
    out_file << document_text(out);
    out_file.close();

    cout << "Output written to " << argv[3] << "\n";

    switch (res.status) {
        case DispatchStatus::FullyServed: return 0;
        case DispatchStatus::Stalled:     return 2;
        default:                          return 1;
    }
}
