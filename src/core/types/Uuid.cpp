#include "core/types/Uuid.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace signfleet::core {

std::string generateUuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> id{};
    for (auto& b : id)
        b = static_cast<uint8_t>(rng());

    // RFC4122 variant + version 4
    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
    }
    return oss.str();
}

bool isUuid(const std::string& text) {
    if (text.size() != 36)
        return false;

    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-')
                return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace signfleet::core
