#include "osrm_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;
using namespace std;

bool parse_http_url(const string &url, HttpUrl &out, string &error) {
    const string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        error = "only plain http:// URLs are supported: " + url;
        return false;
    }

    string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    string authority = rest.substr(0, slash);
    out.target = (slash == string::npos) ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon == string::npos) {
        out.host = authority;
        out.port = "80";
    } else {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    }

    if (out.host.empty() || out.port.empty()) {
        error = "malformed URL: " + url;
        return false;
    }
    return true;
}

bool OsrmProvider::http_get(const HttpUrl &url, HttpResponse &response, string &error) {
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        stream.expires_after(chrono::seconds(timeout_seconds_));
        auto const results = resolver.resolve(url.host, url.port);
        stream.connect(results);

        http::request<http::string_body> req{http::verb::get, url.target, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

        stream.expires_after(chrono::seconds(timeout_seconds_));
        http::write(stream, req);

        // table responses for large instances exceed Beast's default 8 MB body limit
        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(numeric_limits<uint64_t>::max());
        http::read(stream, buffer, parser);

        auto &res = parser.get();
        response.status = (int)res.result_int();
        response.body = move(res.body());

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        // not_connected happens sometimes, nothing to do about it
    } catch (const exception &e) {
        error = string("request to ") + url.host + ":" + url.port + " failed: " + e.what();
        return false;
    }
    return true;
}

MatrixResult OsrmProvider::fetch(const vector<Coordinate> &locations) {
    string full = build_table_url(base_url_, locations);

    HttpUrl url;
    string error;
    if (!parse_http_url(full, url, error))
        return {false, {}, error};

    HttpResponse response{0, ""};
    if (!http_get(url, response, error))
        return {false, {}, error + " (" + to_string(locations.size()) + " locations, url length " +
                           to_string(full.size()) + ")"};

    if (response.status != 200)
        return {false, {}, "table service returned HTTP " + to_string(response.status) + ": " +
                           response.body};

    json j;
    try {
        j = json::parse(response.body);
    } catch (const exception &e) {
        return {false, {}, string("malformed table response: ") + e.what()};
    }
    return parse_table_response(j, locations.size());
}
