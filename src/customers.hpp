#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "config.hpp"

// One row of the customer table, kept as text until the instance builder
// decides whether the coordinate is usable.
struct CustomerRecord {
    int row;              // 0-based data row, header excluded
    std::string latitude;
    std::string longitude;
    std::string name;
    std::string city;
    std::string order_value;
};

std::vector<std::string> split_csv_line(const std::string &line);

bool read_customers_csv(std::istream &in, const ColumnMap &columns,
                        std::vector<CustomerRecord> &records, std::string &error);

bool load_customers_csv(const std::string &filename, const ColumnMap &columns,
                        std::vector<CustomerRecord> &records);
