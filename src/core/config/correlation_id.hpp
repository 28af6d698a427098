#pragma once
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace warden::core::config {

    // Random UUID-v4 string, e.g. "3f2b8c1e-9a4d-4c7e-8b1f-0d2e6a7c9b10".
    // One is generated per run and sent as x-request-id on every API call.
    inline std::string generate_correlation_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dis(0, 255);

        unsigned char bytes[16];
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(dis(gen));
        }
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (int i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

} // namespace warden::core::config
