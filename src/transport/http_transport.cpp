#include "transport/http_transport.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include "core/logging/logger.hpp"
#include "transport/sse_parser.hpp"

namespace agentrun::transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

constexpr std::size_t kReadChunk = 4096;

AgentError deadline_error(const std::string& step) {
    return AgentError{ErrorCategory::Timeout,
                      "Run deadline exceeded while " + step + ".",
                      "deadline_exceeded"};
}

AgentError connection_error(const std::string& message, const std::string& code,
                            const std::string& hint = "") {
    return AgentError{ErrorCategory::Connection, message, code, hint};
}

// Drives `ioc` until the pending operation sets `done`. Returns false when
// `deadline` passed first; the operation is then cancelled and its handler
// drained before returning.
bool run_until_done(net::io_context& ioc, const bool& done,
                    const Clock::time_point deadline,
                    const std::function<void()>& cancel) {
    ioc.restart();
    while (!done) {
        if (ioc.run_one_until(deadline) == 0 && !done) {
            cancel();
            ioc.restart();
            ioc.run();
            return false;
        }
    }
    return true;
}

bool is_port(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    const int value = std::stoi(text);
    return value > 0 && value <= 65535;
}

std::string wire_role(const protocol::Role role) {
    switch (role) {
        case protocol::Role::Caller:
            return "user";
        case protocol::Role::Agent:
            return "assistant";
        case protocol::Role::Tool:
            return "tool";
        default:
            return "user";
    }
}

template <typename Stream>
class BeastFrameSource final : public FrameSource {
public:
    BeastFrameSource(std::unique_ptr<net::io_context> ioc,
                     std::unique_ptr<ssl::context> tls_context)
        : ioc_(std::move(ioc)), tls_context_(std::move(tls_context)) {
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            stream_ = std::make_unique<Stream>(*ioc_, *tls_context_);
        } else {
            stream_ = std::make_unique<Stream>(*ioc_);
        }
        // SSE bodies are unbounded; the run deadline bounds them instead.
        parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());
    }

    ~BeastFrameSource() override { close(); }

    std::optional<AgentError> start(const Endpoint& endpoint,
                                    const StreamRequest& request,
                                    const std::string& body,
                                    const HttpTransportOptions& options,
                                    const Clock::time_point deadline) {
        tcp::resolver resolver(*ioc_);
        bool resolved = false;
        beast::error_code resolve_ec;
        tcp::resolver::results_type results;
        resolver.async_resolve(
            endpoint.host, endpoint.port,
            [&resolved, &resolve_ec, &results](beast::error_code ec,
                                                tcp::resolver::results_type found) {
                resolve_ec = ec;
                results = std::move(found);
                resolved = true;
            });
        if (!run_until_done(*ioc_, resolved, deadline,
                            [&resolver]() { resolver.cancel(); })) {
            return deadline_error("resolving " + endpoint.host);
        }
        if (resolve_ec) {
            return connection_error("Unable to resolve " + endpoint.host + ": " +
                                        resolve_ec.message(),
                                    "resolve_failed");
        }

        AGENTRUN_LOG_DEBUG("HttpTransport: connecting to " + endpoint.host + ":" +
                           endpoint.port);
        auto connected = await(
            [this, &results](auto handler) {
                beast::get_lowest_layer(*stream_).async_connect(results,
                                                                std::move(handler));
            },
            deadline);
        if (!connected.has_value()) {
            return deadline_error("connecting to " + endpoint.host);
        }
        if (connected.value()) {
            return connection_error("Unable to connect to " + endpoint.host + ":" +
                                        endpoint.port + ": " +
                                        connected.value().message(),
                                    "connect_failed");
        }

        if constexpr (std::is_same_v<Stream, TlsStream>) {
            if (!SSL_set_tlsext_host_name(stream_->native_handle(),
                                          endpoint.host.c_str())) {
                return connection_error("Unable to set TLS server name for " +
                                            endpoint.host,
                                        "tls_setup_failed");
            }
            auto handshaken = await(
                [this](auto handler) {
                    stream_->async_handshake(ssl::stream_base::client,
                                             std::move(handler));
                },
                deadline);
            if (!handshaken.has_value()) {
                return deadline_error("negotiating TLS with " + endpoint.host);
            }
            if (handshaken.value()) {
                return connection_error("TLS handshake with " + endpoint.host +
                                            " failed: " +
                                            handshaken.value().message(),
                                        "tls_handshake_failed");
            }
        }

        http::request<http::string_body> req{http::verb::post, endpoint.target, 11};
        req.set(http::field::host, endpoint.host);
        req.set(http::field::user_agent, options.user_agent);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "text/event-stream");
        if (!request.credentials.empty()) {
            req.set(http::field::authorization, "Bearer " + request.credentials);
        }
        req.body() = body;
        req.prepare_payload();

        auto written = await(
            [this, &req](auto handler) {
                http::async_write(*stream_, req, std::move(handler));
            },
            deadline);
        if (!written.has_value()) {
            return deadline_error("sending the request");
        }
        if (written.value()) {
            return connection_error("Unable to send request: " +
                                        written.value().message(),
                                    "request_write_failed");
        }

        auto header = await(
            [this](auto handler) {
                http::async_read_header(*stream_, buffer_, parser_,
                                        std::move(handler));
            },
            deadline);
        if (!header.has_value()) {
            return deadline_error("waiting for the response header");
        }
        if (header.value()) {
            return connection_error("Unable to read response header: " +
                                        header.value().message(),
                                    "response_header_failed");
        }

        const unsigned status = parser_.get().result_int();
        if (status < 200 || status >= 300) {
            const std::string hint =
                (status == 401 || status == 403)
                    ? "The agent service rejected the credentials."
                    : "";
            return connection_error("Agent endpoint answered HTTP " +
                                        std::to_string(status),
                                    "http_status", hint);
        }
        AGENTRUN_LOG_DEBUG("HttpTransport: stream open (HTTP " +
                           std::to_string(status) + ")");
        return std::nullopt;
    }

    core::errors::Result<Pull> next(const Clock::time_point deadline) override {
        while (true) {
            if (closed_) {
                return Pull{PullStatus::EndOfStream, {}};
            }
            if (auto frame = sse_.pop()) {
                if (SseParser::is_end_marker(*frame)) {
                    finished_ = true;
                    sse_.reset();
                    return Pull{PullStatus::EndOfStream, {}};
                }
                return Pull{PullStatus::FrameReady, std::move(*frame)};
            }
            // A body with Content-Length 0, or a 204, is complete with the header.
            if (!finished_ && parser_.is_done()) {
                finished_ = true;
            }
            if (finished_) {
                sse_.finish();
                if (sse_.has_frame()) {
                    continue;
                }
                return Pull{PullStatus::EndOfStream, {}};
            }
            if (Clock::now() >= deadline) {
                return Pull{PullStatus::DeadlineExceeded, {}};
            }

            std::array<char, kReadChunk> chunk;
            parser_.get().body().data = chunk.data();
            parser_.get().body().size = chunk.size();
            auto outcome = await(
                [this](auto handler) {
                    http::async_read_some(*stream_, buffer_, parser_,
                                          std::move(handler));
                },
                deadline);
            if (!outcome.has_value()) {
                return Pull{PullStatus::DeadlineExceeded, {}};
            }

            beast::error_code ec = outcome.value();
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            const std::size_t received = chunk.size() - parser_.get().body().size;
            if (received > 0) {
                sse_.feed(std::string_view(chunk.data(), received));
            }
            if (ec == http::error::end_of_stream || parser_.is_done()) {
                finished_ = true;
                continue;
            }
            if (ec) {
                return connection_error("Stream read failed: " + ec.message(),
                                        "stream_read_failed");
            }
        }
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        beast::error_code ec;
        auto& socket = beast::get_lowest_layer(*stream_).socket();
        if (!socket.is_open()) {
            return;
        }
        socket.shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != net::error::not_connected) {
            AGENTRUN_LOG_DEBUG("HttpTransport: shutdown: " + ec.message());
        }
        socket.close(ec);
    }

private:
    // Starts one async operation and blocks until it completes. nullopt
    // means the deadline passed and the operation was cancelled.
    template <typename Initiate>
    std::optional<beast::error_code> await(Initiate&& initiate,
                                           const Clock::time_point deadline) {
        bool done = false;
        beast::error_code result;
        initiate([&done, &result](beast::error_code ec, auto&&...) {
            result = ec;
            done = true;
        });
        const bool finished = run_until_done(*ioc_, done, deadline, [this]() {
            beast::get_lowest_layer(*stream_).cancel();
        });
        if (!finished) {
            return std::nullopt;
        }
        return result;
    }

    // Declaration order is destruction order in reverse: the io_context and
    // TLS context must outlive the stream.
    std::unique_ptr<net::io_context> ioc_;
    std::unique_ptr<ssl::context> tls_context_;
    std::unique_ptr<Stream> stream_;
    beast::flat_buffer buffer_;
    http::response_parser<http::buffer_body> parser_;
    SseParser sse_;
    bool finished_ = false;
    bool closed_ = false;
};

template <typename Stream>
core::errors::Result<std::unique_ptr<FrameSource>> start_source(
    std::unique_ptr<BeastFrameSource<Stream>> source, const Endpoint& endpoint,
    const StreamRequest& request, const HttpTransportOptions& options,
    const Clock::time_point deadline) {
    const std::string body = build_request_body(request).dump();
    if (auto failure = source->start(endpoint, request, body, options, deadline)) {
        source->close();
        return failure.value();
    }
    return std::unique_ptr<FrameSource>(std::move(source));
}

}  // namespace

core::errors::Result<Endpoint> parse_endpoint(const std::string& url) {
    Endpoint endpoint;
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        endpoint.tls = true;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        endpoint.tls = false;
        rest = url.substr(7);
    } else {
        return AgentError{ErrorCategory::Input,
                          "Endpoint must start with http:// or https://: " + url,
                          "invalid_endpoint"};
    }

    const std::size_t slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.target = rest.substr(slash);
    }

    if (!authority.empty() && authority.front() == '[') {
        const std::size_t close = authority.find(']');
        if (close == std::string::npos) {
            return AgentError{ErrorCategory::Input,
                              "Unterminated IPv6 literal in endpoint: " + url,
                              "invalid_endpoint"};
        }
        endpoint.host = authority.substr(1, close - 1);
        const std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return AgentError{ErrorCategory::Input,
                                  "Unexpected text after IPv6 literal: " + url,
                                  "invalid_endpoint"};
            }
            endpoint.port = after.substr(1);
        }
    } else {
        const std::size_t colon = authority.rfind(':');
        endpoint.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            endpoint.port = authority.substr(colon + 1);
        }
    }

    if (endpoint.host.empty()) {
        return AgentError{ErrorCategory::Input, "Endpoint has no host: " + url,
                          "invalid_endpoint"};
    }
    if (endpoint.port.empty()) {
        endpoint.port = endpoint.tls ? "443" : "80";
    } else if (!is_port(endpoint.port)) {
        return AgentError{ErrorCategory::Input,
                          "Endpoint port is not valid: " + endpoint.port,
                          "invalid_endpoint", "Use a port between 1 and 65535."};
    }
    return endpoint;
}

json build_request_body(const StreamRequest& request) {
    json messages = json::array();
    for (const auto& message : request.conversation.messages) {
        json content = json::array();
        for (const auto& part : message.parts) {
            if (part.kind == protocol::ContentKind::Text) {
                content.push_back({{"type", "text"}, {"text", part.text}});
            } else {
                content.push_back({{"type", "tool_result"},
                                   {"tool_use_id", part.tool_call_id},
                                   {"content", part.payload}});
            }
        }
        messages.push_back({{"role", wire_role(message.role)}, {"content", content}});
    }

    json body;
    body["conversation_id"] = request.conversation.id;
    body["stream"] = true;
    body["messages"] = messages;
    if (request.tool_choice.has_value()) {
        const auto& choice = request.tool_choice.value();
        json tool_choice;
        tool_choice["type"] = protocol::to_string(choice.mode);
        if (!choice.allowed.empty()) {
            tool_choice["name"] = choice.allowed;
        }
        body["tool_choice"] = tool_choice;
    }
    return body;
}

HttpTransport::HttpTransport(HttpTransportOptions options)
    : options_(std::move(options)) {}

core::errors::Result<std::unique_ptr<FrameSource>> HttpTransport::open(
    const StreamRequest& request, const Clock::time_point deadline) {
    auto parsed = parse_endpoint(request.endpoint);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const Endpoint endpoint = core::errors::get_value(parsed);
    auto ioc = std::make_unique<net::io_context>();

    if (!endpoint.tls) {
        auto source = std::make_unique<BeastFrameSource<PlainStream>>(
            std::move(ioc), nullptr);
        return start_source(std::move(source), endpoint, request, options_, deadline);
    }

    auto tls = std::make_unique<ssl::context>(ssl::context::tls_client);
    beast::error_code ec;
    if (options_.verify_peer) {
        tls->set_default_verify_paths(ec);
        if (!ec) {
            tls->set_verify_mode(ssl::verify_peer, ec);
        }
        if (!ec) {
            tls->set_verify_callback(ssl::host_name_verification(endpoint.host), ec);
        }
    } else {
        tls->set_verify_mode(ssl::verify_none, ec);
    }
    if (ec) {
        return connection_error("Unable to configure TLS: " + ec.message(),
                                "tls_setup_failed");
    }
    auto source = std::make_unique<BeastFrameSource<TlsStream>>(std::move(ioc),
                                                                std::move(tls));
    return start_source(std::move(source), endpoint, request, options_, deadline);
}

}  // namespace agentrun::transport
