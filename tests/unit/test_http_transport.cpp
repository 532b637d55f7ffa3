#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "transport/http_transport.hpp"

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using agentrun::core::errors::ErrorCategory;
using agentrun::core::errors::get_error;
using agentrun::core::errors::get_value;
using agentrun::core::errors::is_error;
using agentrun::core::errors::take_value;
using agentrun::protocol::ToolChoice;
using agentrun::protocol::ToolChoiceMode;
using agentrun::transport::Clock;
using agentrun::transport::FrameSource;
using agentrun::transport::HttpTransport;
using agentrun::transport::PullStatus;
using agentrun::transport::StreamRequest;
using nlohmann::json;
using namespace std::chrono_literals;

// Serves exactly one connection on 127.0.0.1 from a background thread.
class LoopbackServer {
public:
    using Handler = std::function<void(tcp::socket&, const http::request<http::string_body>&)>;

    explicit LoopbackServer(Handler handler)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, handler = std::move(handler)]() {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec) {
                return;
            }
            beast::flat_buffer buffer;
            http::read(socket, buffer, request_, ec);
            if (ec) {
                return;
            }
            handler(socket, request_);
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        });
    }

    ~LoopbackServer() { wait(); }

    void wait() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string endpoint(const std::string& path = "/api/v2/agent:run") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    const http::request<http::string_body>& request() const { return request_; }

private:
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    http::request<http::string_body> request_;
    std::thread thread_;
};

void write_raw(tcp::socket& socket, const std::string& bytes) {
    beast::error_code ec;
    net::write(socket, net::buffer(bytes), ec);
}

const char* kSseHeaders =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/event-stream\r\n"
    "Connection: close\r\n"
    "\r\n";

StreamRequest make_request(const std::string& endpoint) {
    StreamRequest request;
    request.endpoint = endpoint;
    request.credentials = "loopback-token";
    request.run_id = "run-loopback";
    request.conversation.id = "conv-loopback";
    request.conversation.messages.push_back(agentrun::protocol::caller_message("Ping?"));
    return request;
}

TEST(HttpTransportTest, ParsesEndpoints) {
    auto https = agentrun::transport::parse_endpoint("https://agents.example.com/api/v2/agent:run");
    ASSERT_FALSE(is_error(https));
    EXPECT_TRUE(get_value(https).tls);
    EXPECT_EQ(get_value(https).host, "agents.example.com");
    EXPECT_EQ(get_value(https).port, "443");
    EXPECT_EQ(get_value(https).target, "/api/v2/agent:run");

    auto plain = agentrun::transport::parse_endpoint("http://localhost:8080");
    ASSERT_FALSE(is_error(plain));
    EXPECT_FALSE(get_value(plain).tls);
    EXPECT_EQ(get_value(plain).port, "8080");
    EXPECT_EQ(get_value(plain).target, "/");

    auto ipv6 = agentrun::transport::parse_endpoint("http://[::1]:9000/run");
    ASSERT_FALSE(is_error(ipv6));
    EXPECT_EQ(get_value(ipv6).host, "::1");
    EXPECT_EQ(get_value(ipv6).port, "9000");
}

TEST(HttpTransportTest, RejectsInvalidEndpoints) {
    for (const std::string url : {"ftp://host/run", "https://", "http://host:0/", "http://host:99999/",
                                  "http://host:abc/", "http://[::1/run"}) {
        auto result = agentrun::transport::parse_endpoint(url);
        ASSERT_TRUE(is_error(result)) << url;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Input) << url;
        EXPECT_EQ(get_error(result).code, "invalid_endpoint") << url;
    }
}

TEST(HttpTransportTest, BuildsRequestBody) {
    StreamRequest request = make_request("http://localhost/run");
    agentrun::protocol::Message tool_message;
    tool_message.role = agentrun::protocol::Role::Tool;
    tool_message.parts.push_back(agentrun::protocol::tool_result_part("t1", json{{"hits", 3}}));
    request.conversation.messages.push_back(tool_message);

    const json body = agentrun::transport::build_request_body(request);
    EXPECT_EQ(body["conversation_id"], "conv-loopback");
    EXPECT_EQ(body["stream"], true);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
    EXPECT_EQ(body["messages"][0]["content"][0], json({{"type", "text"}, {"text", "Ping?"}}));
    EXPECT_EQ(body["messages"][1]["role"], "tool");
    EXPECT_EQ(body["messages"][1]["content"][0]["tool_use_id"], "t1");
    EXPECT_FALSE(body.contains("tool_choice"));

    ToolChoice choice;
    choice.mode = ToolChoiceMode::Auto;
    choice.allowed = {"search", "analyst"};
    request.tool_choice = choice;
    const json constrained = agentrun::transport::build_request_body(request);
    EXPECT_EQ(constrained["tool_choice"]["type"], "auto");
    EXPECT_EQ(constrained["tool_choice"]["name"], json({"analyst", "search"}));
}

TEST(HttpTransportTest, StreamsFramesFromLoopbackServer) {
    LoopbackServer server([](tcp::socket& socket, const http::request<http::string_body>&) {
        write_raw(socket, kSseHeaders);
        write_raw(socket, "event: response.text.delta\ndata: {\"text\":\"Hel\"}\n\n");
        std::this_thread::sleep_for(20ms);
        write_raw(socket, "event: response.text.delta\ndata: {\"te");
        std::this_thread::sleep_for(20ms);
        write_raw(socket, "xt\":\"lo\"}\n\n: keep-alive\n\nevent: response\ndata: {}\n\n");
        write_raw(socket, "data: [DONE]\n\n");
    });

    HttpTransport transport;
    const auto deadline = Clock::now() + 5s;
    auto opened = transport.open(make_request(server.endpoint()), deadline);
    ASSERT_FALSE(is_error(opened)) << get_error(opened).message;
    std::unique_ptr<FrameSource> source = take_value(std::move(opened));

    std::vector<std::string> events;
    std::vector<std::string> data;
    while (true) {
        auto pulled = source->next(deadline);
        ASSERT_FALSE(is_error(pulled));
        const auto& pull = get_value(pulled);
        if (pull.status != PullStatus::FrameReady) {
            EXPECT_EQ(pull.status, PullStatus::EndOfStream);
            break;
        }
        events.push_back(pull.frame.event);
        data.push_back(pull.frame.data);
    }
    source->close();
    server.wait();

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], "response.text.delta");
    EXPECT_EQ(data[1], "{\"text\":\"lo\"}");
    EXPECT_EQ(events[2], "response");

    const auto& request = server.request();
    EXPECT_EQ(request.method(), http::verb::post);
    EXPECT_EQ(std::string(request.target()), "/api/v2/agent:run");
    EXPECT_EQ(std::string(request[http::field::authorization]), "Bearer loopback-token");
    EXPECT_EQ(std::string(request[http::field::accept]), "text/event-stream");
    const json body = json::parse(request.body());
    EXPECT_EQ(body["conversation_id"], "conv-loopback");
}

TEST(HttpTransportTest, ClosedConnectionEndsStream) {
    LoopbackServer server([](tcp::socket& socket, const http::request<http::string_body>&) {
        write_raw(socket, kSseHeaders);
        write_raw(socket, "event: response.text.delta\ndata: {\"text\":\"partial\"}\n\n");
    });

    HttpTransport transport;
    const auto deadline = Clock::now() + 5s;
    auto opened = transport.open(make_request(server.endpoint()), deadline);
    ASSERT_FALSE(is_error(opened));
    auto source = take_value(std::move(opened));

    auto first = source->next(deadline);
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).status, PullStatus::FrameReady);
    auto second = source->next(deadline);
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).status, PullStatus::EndOfStream);
}

TEST(HttpTransportTest, ReportsHttpErrorStatus) {
    LoopbackServer server([](tcp::socket& socket, const http::request<http::string_body>&) {
        write_raw(socket,
                  "HTTP/1.1 401 Unauthorized\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    });

    HttpTransport transport;
    auto opened = transport.open(make_request(server.endpoint()), Clock::now() + 5s);
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).category, ErrorCategory::Connection);
    EXPECT_EQ(get_error(opened).code, "http_status");
    EXPECT_FALSE(get_error(opened).hint.empty());
}

TEST(HttpTransportTest, ReportsRefusedConnection) {
    std::string endpoint;
    {
        net::io_context ioc;
        tcp::acceptor probe(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        endpoint = "http://127.0.0.1:" + std::to_string(probe.local_endpoint().port()) + "/run";
    }

    HttpTransport transport;
    auto opened = transport.open(make_request(endpoint), Clock::now() + 5s);
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).category, ErrorCategory::Connection);
    EXPECT_EQ(get_error(opened).code, "connect_failed");
}

TEST(HttpTransportTest, SilentStreamReturnsAtDeadline) {
    LoopbackServer server([](tcp::socket& socket, const http::request<http::string_body>&) {
        write_raw(socket, kSseHeaders);
        // Hold the connection open until the client goes away.
        char byte = 0;
        beast::error_code ec;
        socket.read_some(net::buffer(&byte, 1), ec);
    });

    HttpTransport transport;
    auto opened = transport.open(make_request(server.endpoint()), Clock::now() + 5s);
    ASSERT_FALSE(is_error(opened));
    auto source = take_value(std::move(opened));

    const auto started = Clock::now();
    auto pulled = source->next(Clock::now() + 100ms);
    const auto elapsed = Clock::now() - started;
    ASSERT_FALSE(is_error(pulled));
    EXPECT_EQ(get_value(pulled).status, PullStatus::DeadlineExceeded);
    EXPECT_GE(elapsed, 90ms);
    EXPECT_LT(elapsed, 3s);

    source->close();
    auto after_close = source->next(Clock::now() + 1s);
    ASSERT_FALSE(is_error(after_close));
    EXPECT_EQ(get_value(after_close).status, PullStatus::EndOfStream);
    server.wait();
}

TEST(HttpTransportTest, EmptyBodyEndsStreamImmediately) {
    LoopbackServer server([](tcp::socket& socket, const http::request<http::string_body>&) {
        write_raw(socket,
                  "HTTP/1.1 200 OK\r\n"
                  "Content-Type: text/event-stream\r\n"
                  "Content-Length: 0\r\n"
                  "\r\n");
        // Keep the socket open so only the empty body can end the stream.
        char byte = 0;
        beast::error_code ec;
        socket.read_some(net::buffer(&byte, 1), ec);
    });

    HttpTransport transport;
    auto opened = transport.open(make_request(server.endpoint()), Clock::now() + 5s);
    ASSERT_FALSE(is_error(opened));
    auto source = take_value(std::move(opened));

    const auto started = Clock::now();
    auto pulled = source->next(Clock::now() + 2s);
    const auto elapsed = Clock::now() - started;
    ASSERT_FALSE(is_error(pulled));
    EXPECT_EQ(get_value(pulled).status, PullStatus::EndOfStream);
    EXPECT_LT(elapsed, 1s);

    source->close();
    server.wait();
}

}  // namespace
