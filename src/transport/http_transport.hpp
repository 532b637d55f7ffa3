#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "transport/frame_source.hpp"

namespace agentrun::transport {

struct Endpoint {
    bool tls = true;
    std::string host;
    std::string port;
    std::string target = "/";
};

core::errors::Result<Endpoint> parse_endpoint(const std::string& url);

// JSON body POSTed to the agent endpoint to start a streamed run.
nlohmann::json build_request_body(const StreamRequest& request);

struct HttpTransportOptions {
    std::string user_agent = "agentrun/1.0";
    bool verify_peer = true;
};

// HTTP(S) transport over Boost.Beast. Each open() owns its own io_context,
// so transports opened by parallel runs never share state.
class HttpTransport : public Transport {
public:
    explicit HttpTransport(HttpTransportOptions options = {});

    core::errors::Result<std::unique_ptr<FrameSource>> open(
        const StreamRequest& request, Clock::time_point deadline) override;

private:
    HttpTransportOptions options_;
};

}  // namespace agentrun::transport
