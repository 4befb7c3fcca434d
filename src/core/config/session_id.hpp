#pragma once
#include <string>
#include <random>
#include <sstream>

namespace memvault::core::config {

    // Generates a simple 8-character hex ID prefixed with "sess-"
    inline std::string generate_session_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "sess-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace memvault::core::config
