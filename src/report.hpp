#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "instance.hpp"
#include "optimizer.hpp"
#include "scheduler.hpp"
#include "nlohmann/json.hpp"

void print_rejected(std::ostream &out, const std::vector<RejectedRecord> &rejected);
void print_single_trip(std::ostream &out, const ProblemInstance &inst, const SingleTripReport &rep);
void print_round(std::ostream &out, const ProblemInstance &inst, const RoundReport &rep, int served_so_far);
void print_summary(std::ostream &out, const DispatchResult &res);

// Every round, then the summary.
void print_dispatch(std::ostream &out, const ProblemInstance &inst, const DispatchResult &res);

std::string format_km(double meters);
std::string stop_label(const Node &n);

nlohmann::json trip_to_json(const ProblemInstance &inst, const VehicleTrip &trip);
nlohmann::json dispatch_to_json(const RunConfig &cfg, const BuildResult &built,
                                const OptimizerResult &solved, const SingleTripReport &single,
                                const DispatchResult &res);

// Indented text of a result document. Bytes that are not valid UTF-8 (e.g. a
// CSV exported as Windows-1252) come out as U+FFFD.
std::string document_text(const nlohmann::json &doc);
