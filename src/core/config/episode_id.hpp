#pragma once
#include <string>
#include <random>
#include <sstream>

namespace compgym::core::config {

    // 8 random hex digits, used for ids and cache-file suffixes.
    inline std::string random_hex_suffix(int digits = 8) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < digits; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Generates an id of the form "episode-xxxxxxxx".
    inline std::string generate_episode_id() {
        return "episode-" + random_hex_suffix();
    }

} // namespace compgym::core::config
