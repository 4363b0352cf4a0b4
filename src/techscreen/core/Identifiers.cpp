#include <techscreen/core/Identifiers.hpp>

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace TS {

auto freshId() -> std::string {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    std::array<unsigned char, 16> buffer{};
    std::uniform_int_distribution<int> byteDist(0, 255);
    for (auto& byte : buffer) {
        byte = static_cast<unsigned char>(byteDist(engine));
    }
    buffer[6] = static_cast<unsigned char>((buffer[6] & 0x0F) | 0x40);
    buffer[8] = static_cast<unsigned char>((buffer[8] & 0x3F) | 0x80);

    std::ostringstream stream;
    stream << std::uppercase << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            stream << '-';
        }
        stream << std::setw(2) << static_cast<int>(buffer[i]);
    }
    return stream.str();
}

} // namespace TS
