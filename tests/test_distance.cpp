#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <fstream>
#include <thread>
#include "distance.hpp"
#include "osrm_client.hpp"

using json = nlohmann::json;

TEST(TableUrl, DepotFirstSemicolonSeparated) {
    std::vector<Coordinate> locs = {{77.5946, 12.9716}, {77.6, 12.9}, {77.7, 13.1}};
    EXPECT_EQ(build_table_url("http://localhost:5001/table/v1/driving/", locs),
              "http://localhost:5001/table/v1/driving/77.5946,12.9716;77.6,12.9;77.7,13.1"
              "?annotations=distance");
}

TEST(TableResponse, ParsesDistances) {
    json j = json::parse(R"({"code": "Ok", "distances": [[0, 1200.5], [1300, 0]]})");
    MatrixResult r = parse_table_response(j, 2);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_DOUBLE_EQ(r.matrix[0][1], 1200.5);
    EXPECT_DOUBLE_EQ(r.matrix[1][0], 1300.0);
}

TEST(TableResponse, MissingDistancesIsAnError) {
    json j = json::parse(R"({"code": "InvalidQuery", "message": "Query string malformed"})");
    MatrixResult r = parse_table_response(j, 2);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.error.find("no distances"), std::string::npos);
    EXPECT_NE(r.error.find("InvalidQuery"), std::string::npos);
}

TEST(TableResponse, UnroutablePair) {
    json j = json::parse(R"({"distances": [[0, null], [5, 0]]})");
    MatrixResult r = parse_table_response(j, 2);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.error.find("no route"), std::string::npos);
}

TEST(TableResponse, WrongShape) {
    EXPECT_FALSE(parse_table_response(json::parse(R"({"distances": [[0, 1], [1, 0]]})"), 3).ok);
    EXPECT_FALSE(parse_table_response(json::parse(R"({"distances": [[0, 1], [1]]})"), 2).ok);
    EXPECT_FALSE(parse_table_response(json::parse(R"({"distances": "x"})"), 2).ok);
    EXPECT_FALSE(parse_table_response(json::parse(R"({"distances": [[0, "a"], [1, 0]]})"), 2).ok);
}

TEST(ValidateMatrix, DiagonalAndSign) {
    std::string error;
    EXPECT_TRUE(validate_matrix({{0, 2}, {3, 0}}, 2, error));
    EXPECT_FALSE(validate_matrix({{1, 2}, {3, 0}}, 2, error));
    EXPECT_NE(error.find("diagonal"), std::string::npos);
    EXPECT_FALSE(validate_matrix({{0, -2}, {3, 0}}, 2, error));
}

TEST(Haversine, ProviderBuildsSquareMatrix) {
    HaversineProvider p;
    MatrixResult r = p.fetch({{77.5946, 12.9716}, {77.6, 12.9}, {77.7, 13.1}});
    ASSERT_TRUE(r.ok);
    ASSERT_EQ(r.matrix.size(), 3u);
    for (int i = 0; i < 3; i++) {
        EXPECT_DOUBLE_EQ(r.matrix[i][i], 0.0);
        for (int j = 0; j < 3; j++) EXPECT_DOUBLE_EQ(r.matrix[i][j], r.matrix[j][i]);
    }
    EXPECT_GT(r.matrix[0][2], 0.0);
}

TEST(TableFile, ReadsSavedResponse) {
    std::string path = ::testing::TempDir() + "dispatch_table.json";
    {
        std::ofstream out(path);
        out << R"({"distances": [[0, 10, 20], [10, 0, 15], [20, 15, 0]]})";
    }
    TableFileProvider p(path);
    MatrixResult r = p.fetch({{0, 0}, {0, 0}, {0, 0}});
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_DOUBLE_EQ(r.matrix[1][2], 15.0);

    MatrixResult wrong = p.fetch({{0, 0}, {0, 0}});
    EXPECT_FALSE(wrong.ok);
}

TEST(TableFile, MissingFile) {
    TableFileProvider p("no-such-table.json");
    MatrixResult r = p.fetch({{0, 0}});
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.error.find("no-such-table.json"), std::string::npos);
}

TEST(HttpUrl, HostPortTarget) {
    HttpUrl u;
    std::string error;
    ASSERT_TRUE(parse_http_url("http://localhost:5001/table/v1/driving/1,2", u, error));
    EXPECT_EQ(u.host, "localhost");
    EXPECT_EQ(u.port, "5001");
    EXPECT_EQ(u.target, "/table/v1/driving/1,2");

    ASSERT_TRUE(parse_http_url("http://router.example", u, error));
    EXPECT_EQ(u.port, "80");
    EXPECT_EQ(u.target, "/");

    EXPECT_FALSE(parse_http_url("https://router.example/", u, error));
    EXPECT_FALSE(parse_http_url("http://:80/", u, error));
}

// Serves a canned response instead of opening a socket.
class CannedOsrm : public OsrmProvider {
public:
    CannedOsrm(int status, std::string body, bool reachable = true)
        : OsrmProvider("http://localhost:5001/table/v1/driving/", 5),
          status_(status), body_(std::move(body)), reachable_(reachable) {}

    std::string last_target;

protected:
    bool http_get(const HttpUrl &url, HttpResponse &response, std::string &error) override {
        last_target = url.target;
        if (!reachable_) {
            error = "connection refused";
            return false;
        }
        response.status = status_;
        response.body = body_;
        return true;
    }

private:
    int status_;
    std::string body_;
    bool reachable_;
};

TEST(Osrm, SuccessfulTable) {
    CannedOsrm p(200, R"({"code": "Ok", "distances": [[0, 900], [950, 0]]})");
    MatrixResult r = p.fetch({{77.5946, 12.9716}, {77.6, 12.9}});
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_DOUBLE_EQ(r.matrix[1][0], 950.0);
    EXPECT_EQ(p.last_target, "/table/v1/driving/77.5946,12.9716;77.6,12.9?annotations=distance");
}

TEST(Osrm, NonOkStatusEchoesBody) {
    CannedOsrm p(400, R"({"code": "TooBig"})");
    MatrixResult r = p.fetch({{77.5946, 12.9716}, {77.6, 12.9}});
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.error.find("HTTP 400"), std::string::npos);
    EXPECT_NE(r.error.find("TooBig"), std::string::npos);
}

TEST(Osrm, UnreachableServiceReportsRequestSize) {
    CannedOsrm p(0, "", false);
    MatrixResult r = p.fetch({{77.5946, 12.9716}, {77.6, 12.9}, {77.7, 13.0}});
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.error.find("connection refused"), std::string::npos);
    EXPECT_NE(r.error.find("3 locations"), std::string::npos);
}

TEST(Osrm, MalformedBody) {
    CannedOsrm p(200, "<html>");
    EXPECT_FALSE(p.fetch({{0, 0}}).ok);
}

// Serves one canned response on a loopback port.
static void serve_once(boost::asio::ip::tcp::acceptor &acceptor, const std::string &body) {
    namespace net = boost::asio;
    net::ip::tcp::socket sock(acceptor.get_executor());
    acceptor.accept(sock);

    net::streambuf request;
    net::read_until(sock, request, "\r\n\r\n");

    std::string head = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: " +
                       std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n";
    net::write(sock, net::buffer(head));
    net::write(sock, net::buffer(body));

    boost::system::error_code ec;
    sock.shutdown(net::ip::tcp::socket::shutdown_both, ec);
}

TEST(Osrm, ReadsTableLargerThanDefaultBodyLimit) {
    namespace net = boost::asio;
    net::io_context ioc;
    net::ip::tcp::acceptor acceptor(ioc, net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    unsigned short port = acceptor.local_endpoint().port();

    // whitespace padding takes the body past 8 MB
    std::string body = R"({"code": "Ok", "distances": [[0, 900], [950, 0]]})" + std::string(9 << 20, ' ');
    std::thread server([&] { serve_once(acceptor, body); });

    OsrmProvider osrm("http://127.0.0.1:" + std::to_string(port) + "/table/v1/driving/", 10);
    MatrixResult r = osrm.fetch({{77.5946, 12.9716}, {77.6, 12.9}});
    server.join();

    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_DOUBLE_EQ(r.matrix[0][1], 900.0);
    EXPECT_DOUBLE_EQ(r.matrix[1][0], 950.0);
}

TEST(RouteDistance, SumsConsecutiveArcs) {
    DistanceMatrix m = {{0, 1, 5}, {2, 0, 3}, {4, 6, 0}};
    EXPECT_DOUBLE_EQ(route_distance(m, {0, 1, 2, 0}), 1 + 3 + 4);
    EXPECT_DOUBLE_EQ(route_distance(m, {0}), 0.0);
}
