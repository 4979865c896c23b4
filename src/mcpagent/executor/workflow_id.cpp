#include <mcpagent/executor/workflow_id.h>

#include <array>
#include <cstdint>
#include <random>

namespace mcpagent::executor {

namespace {

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

}  // namespace

std::string generate_uuid4() {
    std::array<uint8_t, 16> bytes{};
    auto& rng = thread_rng();
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t word = rng();
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

std::string make_workflow_id(std::string_view workflow_type) {
    std::string id(workflow_type);
    id.push_back('-');
    id += generate_uuid4();
    return id;
}

}  // namespace mcpagent::executor
