#include "geo.hpp"
#include <cmath>
#include <algorithm>
#include <sstream>
#include <iomanip>

static const double EARTH_RADIUS_M = 6371008.8;

bool BoundingBox::contains(const Coordinate &c) const {
    return c.lat >= min_lat && c.lat <= max_lat &&
           c.lon >= min_lon && c.lon <= max_lon;
}

bool in_legal_range(const Coordinate &c) {
    return c.lat >= -90.0 && c.lat <= 90.0 &&
           c.lon >= -180.0 && c.lon <= 180.0;
}

double haversine_m(const Coordinate &a, const Coordinate &b) {
    const double PI = std::acos(-1.0);
    double lat1 = a.lat * PI / 180.0;
    double lat2 = b.lat * PI / 180.0;
    double dlat = lat2 - lat1;
    double dlon = (b.lon - a.lon) * PI / 180.0;

    double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
    return 2.0 * EARTH_RADIUS_M * std::asin(std::min(1.0, std::sqrt(h)));
}

std::string to_lonlat_string(const Coordinate &c) {
    std::ostringstream ss;
    ss << std::setprecision(10) << c.lon << "," << c.lat;
    return ss.str();
}
