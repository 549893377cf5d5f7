#pragma once
#include <string>

struct Coordinate {
    double lon;
    double lat;
};

struct BoundingBox {
    double min_lat, max_lat;
    double min_lon, max_lon;

    bool contains(const Coordinate &c) const;
};

bool in_legal_range(const Coordinate &c);

// Great-circle distance in meters.
double haversine_m(const Coordinate &a, const Coordinate &b);

// "lon,lat" as the table service expects it.
std::string to_lonlat_string(const Coordinate &c);
