#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include "network/http_server.hpp"
#include "network/request_handler.hpp"
#include "server/pastebin_server.hpp"
#include "store/paste_store.hpp"
#include "test_utils.hpp"

using namespace pastebin::network;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

// Blocking HTTP/1.1 client over one connection
class TestClient {
public:
    explicit TestClient(uint16_t port) : socket_(io_context_) {
        socket_.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    }

    ~TestClient() {
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
    }

    http::response<http::string_body> send(http::verb method, const std::string& target,
                                           const std::string& device_code = "",
                                           const std::string& body = "",
                                           bool keep_alive = true) {
        http::request<http::string_body> request{method, target, 11};
        request.set(http::field::host, "localhost");
        if (!device_code.empty()) {
            request.set(RequestHandler::DEVICE_CODE_HEADER, device_code);
        }
        request.keep_alive(keep_alive);
        request.body() = body;
        request.prepare_payload();
        http::write(socket_, request);

        http::response<http::string_body> response;
        http::read(socket_, buffer_, response);
        return response;
    }

private:
    boost::asio::io_context io_context_;
    tcp::socket socket_;
    beast::flat_buffer buffer_;
};

std::string id_from_uri(const std::string& uri) {
    return uri.substr(uri.rfind('/') + 1, uri.size() - uri.rfind('/') - 2);
}

} // namespace

class HttpServerTest : public ::testing::Test {
protected:
    static constexpr std::size_t MAX_PASTE_SIZE = 16;

    std::unique_ptr<pastebin::store::PasteStore> store;
    std::unique_ptr<RequestHandler> handler;
    std::unique_ptr<HttpServer> server;

    void SetUp() override {
        quiet_logging();
        store = std::make_unique<pastebin::store::PasteStore>();
        handler = std::make_unique<RequestHandler>(*store, MAX_PASTE_SIZE);
        server = std::make_unique<HttpServer>(0, "127.0.0.1", *handler, 2);
    }

    void TearDown() override {
        if (server) {
            server->shutdown();
        }
    }
};

TEST_F(HttpServerTest, StartListenerTest) {
    ASSERT_TRUE(server->start_listener());
    EXPECT_TRUE(server->is_running());
    EXPECT_NE(server->port(), 0);
}

TEST_F(HttpServerTest, MultipleStartTest) {
    ASSERT_TRUE(server->start_listener());
    ASSERT_FALSE(server->start_listener()); // Second start should fail
}

TEST_F(HttpServerTest, ShutdownTest) {
    ASSERT_TRUE(server->start_listener());
    server->shutdown();
    EXPECT_FALSE(server->is_running());

    // Should be able to start again after shutdown
    ASSERT_TRUE(server->start_listener());
    TestClient client(server->port());
    EXPECT_EQ(client.send(http::verb::get, "/").result(), http::status::ok);
}

TEST_F(HttpServerTest, InvalidAddressFails) {
    HttpServer bad(0, "not-an-address", *handler);
    EXPECT_FALSE(bad.start_listener());
    EXPECT_FALSE(bad.is_running());
}

TEST_F(HttpServerTest, PutThenGetOverOneConnection) {
    ASSERT_TRUE(server->start_listener());
    TestClient client(server->port());

    auto put = client.send(http::verb::put, "/", "DEVICE01", "over the wire");
    ASSERT_EQ(put.result(), http::status::ok);
    EXPECT_EQ(put.body().rfind("https://localhost/", 0), 0u);

    // Keep-alive: the second request reuses the connection
    auto get = client.send(http::verb::get, "/" + id_from_uri(put.body()), "DEVICE01");
    ASSERT_EQ(get.result(), http::status::ok);
    EXPECT_EQ(get.body(), "over the wire");
    EXPECT_EQ(get[http::field::server], "pastebin");
}

TEST_F(HttpServerTest, OversizedBodyRejected) {
    ASSERT_TRUE(server->start_listener());
    TestClient client(server->port());

    auto response = client.send(http::verb::put, "/", "DEVICE01", std::string(64, 'x'));
    EXPECT_EQ(response.result(), http::status::payload_too_large);
    EXPECT_FALSE(response.keep_alive());
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(HttpServerTest, ConnectionCloseHonored) {
    ASSERT_TRUE(server->start_listener());
    TestClient client(server->port());

    auto response = client.send(http::verb::get, "/", "", "", false);
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_FALSE(response.keep_alive());
}

TEST_F(HttpServerTest, ClientsAreIsolated) {
    ASSERT_TRUE(server->start_listener());
    TestClient first(server->port());
    TestClient second(server->port());

    auto put = first.send(http::verb::put, "/", "DEVICE01", "mine");
    ASSERT_EQ(put.result(), http::status::ok);

    auto get = second.send(http::verb::get, "/" + id_from_uri(put.body()), "DEVICE02");
    EXPECT_EQ(get.result(), http::status::not_found);

    auto all = second.send(http::verb::get, "/all", "DEVICE02");
    ASSERT_EQ(all.result(), http::status::ok);
    EXPECT_EQ(all.body(), "[]");
}

TEST(PastebinServerTest, ServesIssuedDeviceCode) {
    quiet_logging();

    pastebin::config::ServerConfig config;
    config.port = 0;
    config.threads = 1;
    config.device_paste_limit = 1;
    config.valid = true;

    pastebin::server::PastebinServer pastebin_server(config);
    ASSERT_TRUE(pastebin_server.start());

    TestClient client(pastebin_server.get_http_server().port());
    auto device = client.send(http::verb::get, "/device");
    ASSERT_EQ(device.result(), http::status::ok);
    auto code = nlohmann::json::parse(device.body())["device_code"].get<std::string>();

    client.send(http::verb::put, "/", code, "first");
    client.send(http::verb::put, "/", code, "second");

    EXPECT_EQ(pastebin_server.get_store().list_ids(code).size(), 1u);
    EXPECT_TRUE(pastebin_server.shutdown());
}

TEST(PastebinServerTest, ShutdownRunsOnce) {
    quiet_logging();

    pastebin::config::ServerConfig config;
    config.port = 0;
    config.threads = 1;
    config.valid = true;

    LogCapture capture;
    {
        pastebin::server::PastebinServer pastebin_server(config);
        ASSERT_TRUE(pastebin_server.start());
        EXPECT_TRUE(pastebin_server.is_running());

        EXPECT_TRUE(pastebin_server.shutdown());
        EXPECT_FALSE(pastebin_server.is_running());
        EXPECT_TRUE(pastebin_server.shutdown());
    }  // Destructor must not shut down a second time

    EXPECT_EQ(capture.count("Pastebin server: Initiating shutdown sequence"), 1u);
    EXPECT_EQ(capture.count("Pastebin server: Shutdown complete"), 1u);
}

TEST(PastebinServerTest, NeverStartedServerShutsDownQuietly) {
    quiet_logging();

    pastebin::config::ServerConfig config;
    config.port = 0;
    config.threads = 1;

    LogCapture capture;
    {
        pastebin::server::PastebinServer pastebin_server(config);
        EXPECT_FALSE(pastebin_server.is_running());
    }

    EXPECT_EQ(capture.count("Pastebin server: Initiating shutdown sequence"), 0u);
}
