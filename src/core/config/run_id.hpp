#pragma once
#include <string>
#include <random>
#include <sstream>

namespace scriptgate::core::config {

    // Generates "<prefix>-" followed by 12 random hex digits.
    // Used for working directory names, log prefixes and SCRIPTGATE_RUN_ID.
    inline std::string generate_run_id(const std::string& prefix = "run") {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 12; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace scriptgate::core::config
