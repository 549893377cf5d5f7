#include "customers.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

using namespace std;

vector<string> split_csv_line(const string &line) {
    vector<string> fields;
    string cur;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur += '"';
                    i++;
                } else {
                    quoted = false;
                }
            } else {
                cur += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    fields.push_back(cur);
    return fields;
}

static void strip_cr(string &line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

static bool is_blank(const string &line) {
    return line.find_first_not_of(" \t") == string::npos;
}

bool read_customers_csv(istream &in, const ColumnMap &columns,
                        vector<CustomerRecord> &records, string &error)
{
    records.clear();

    string line;
    if (!getline(in, line)) {
        error = "customer table is empty";
        return false;
    }
    strip_cr(line);
    // UTF-8 byte order mark written by spreadsheet exports
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
        line.erase(0, 3);

    vector<string> header = split_csv_line(line);
    unordered_map<string, int> col;
    for (int i = 0; i < (int)header.size(); i++)
        col[header[i]] = i;

    if (!col.count(columns.latitude)) {
        error = "missing latitude column '" + columns.latitude + "'";
        return false;
    }
    if (!col.count(columns.longitude)) {
        error = "missing longitude column '" + columns.longitude + "'";
        return false;
    }

    auto field = [&](const vector<string> &f, const string &name) -> string {
        auto it = col.find(name);
        if (it == col.end() || it->second >= (int)f.size()) return "";
        return f[it->second];
    };

    int row = 0;
    while (getline(in, line)) {
        strip_cr(line);
        if (is_blank(line)) continue;

        vector<string> f = split_csv_line(line);
        CustomerRecord r;
        r.row = row++;
        r.latitude = field(f, columns.latitude);
        r.longitude = field(f, columns.longitude);
        r.name = field(f, columns.name);
        r.city = field(f, columns.city);
        r.order_value = field(f, columns.order_value);
        records.push_back(r);
    }
    return true;
}

bool load_customers_csv(const string &filename, const ColumnMap &columns,
                        vector<CustomerRecord> &records)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open customer file: " << filename << "\n";
        return false;
    }

    string error;
    if (!read_customers_csv(fin, columns, records, error)) {
        cerr << "Error reading " << filename << ": " << error << "\n";
        return false;
    }
    return true;
}
