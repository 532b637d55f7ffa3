#pragma once
#include <cctype>
#include <string>
#include <random>
#include <sstream>

namespace agentrun::core::config {

    // Generates a random lowercase hex id: "<prefix>-" followed by `digits` nibbles.
    inline std::string generate_id(const std::string& prefix, int digits) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < digits; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Run ids key the artifact directory of every run.
    inline std::string generate_run_id() {
        return generate_id("run", 16);
    }

    inline std::string generate_conversation_id() {
        return generate_id("conv", 12);
    }

    // Ids become directory names; only [A-Za-z0-9._-] is accepted and the
    // id may not start with a dot.
    inline bool is_path_safe_id(const std::string& id) {
        if (id.empty() || id.size() > 128 || id.front() == '.') {
            return false;
        }
        for (const char c : id) {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) == 0 && c != '-' && c != '_' && c != '.') {
                return false;
            }
        }
        return true;
    }

} // namespace agentrun::core::config
