#pragma once
#include <random>
#include <sstream>
#include <string>

namespace helm::core::config {

    // Generates an 8-character hex id, e.g. "turn-3fa92c01".
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_turn_id() {
        return generate_id("turn");
    }

} // namespace helm::core::config
