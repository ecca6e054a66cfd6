#include "KnxIpFrame.hpp"

#include <limits>
#include <stdexcept>

namespace KnxLink::KnxIp {

namespace {
uint16_t checked_total_length(std::size_t body_size) {
    if (body_size > std::numeric_limits<uint16_t>::max() - KnxIpFrame::kHeaderSize) {
        throw std::length_error("KnxIpFrame body exceeds protocol limits");
    }
    return static_cast<uint16_t>(KnxIpFrame::kHeaderSize + body_size);
}
} // namespace

KnxIpFrame::KnxIpFrame(ServiceType type, std::vector<uint8_t> body)
    : body_(std::move(body)) {
    header_.service_type = type;
    header_.total_length = checked_total_length(body_.size());
}

void KnxIpFrame::set_body(std::vector<uint8_t> body) {
    header_.total_length = checked_total_length(body.size());
    body_ = std::move(body);
}

std::string KnxIpFrame::to_string() const {
    return "<KnxIpFrame " + describe_service_type(header_.service_type) +
           " total_length=\"" + std::to_string(header_.total_length) +
           "\" body=\"" + to_hex(body_) + "\"/>";
}

std::string to_hex(std::span<const uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& text) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    int high = -1;
    for (char c : text) {
        if (c == ' ') continue;
        int v = nibble(c);
        if (v < 0) return std::nullopt;
        if (high < 0) {
            high = v;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | v));
            high = -1;
        }
    }
    if (high >= 0) return std::nullopt; // odd digit count
    return out;
}

} // namespace KnxLink::KnxIp
