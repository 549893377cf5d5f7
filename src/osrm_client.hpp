#pragma once
#include <string>
#include "distance.hpp"

struct HttpUrl {
    std::string host;
    std::string port;
    std::string target;   // path and query
};

bool parse_http_url(const std::string &url, HttpUrl &out, std::string &error);

struct HttpResponse {
    int status;
    std::string body;
};

// Queries the table service of an OSRM server, e.g.
// http://localhost:5001/table/v1/driving/
class OsrmProvider : public DistanceProvider {
public:
    OsrmProvider(std::string base_url, int timeout_seconds)
        : base_url_(std::move(base_url)), timeout_seconds_(timeout_seconds) {}

    MatrixResult fetch(const std::vector<Coordinate> &locations) override;

protected:
    virtual bool http_get(const HttpUrl &url, HttpResponse &response, std::string &error);

private:
    std::string base_url_;
    int timeout_seconds_;
};
