#include "KnxIpCodec.hpp"

#include <cstdio>

namespace KnxLink::KnxIp {

KnxIpFrame KnxIpCodec::decode(std::span<const uint8_t> raw) const {
    if (raw.size() < KnxIpFrame::kHeaderSize) {
        throw CouldNotParseKnxIp("wrong connection header length (" + std::to_string(raw.size()) + " bytes)");
    }
    if (raw[0] != KnxIpHeader::kHeaderLength) {
        throw CouldNotParseKnxIp("wrong header length");
    }
    if (raw[1] != KnxIpHeader::kProtocolVersion) {
        throw CouldNotParseKnxIp("wrong protocol version");
    }

    const uint16_t service = static_cast<uint16_t>((raw[2] << 8) | raw[3]);
    if (!is_known_service_type(service)) {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%04X", service);
        throw CouldNotParseKnxIp(std::string("unknown service type ") + hex);
    }

    const uint16_t total_length = static_cast<uint16_t>((raw[4] << 8) | raw[5]);
    if (total_length != raw.size()) {
        throw CouldNotParseKnxIp("total length " + std::to_string(total_length) +
                                 " does not match datagram size " + std::to_string(raw.size()));
    }

    KnxIpHeader header;
    header.header_length = raw[0];
    header.protocol_version = raw[1];
    header.service_type = static_cast<ServiceType>(service);
    header.total_length = total_length;
    return KnxIpFrame(header, std::vector<uint8_t>(raw.begin() + KnxIpFrame::kHeaderSize, raw.end()));
}

std::vector<uint8_t> KnxIpCodec::encode(const KnxIpFrame& frame) const {
    const auto body = frame.body();
    const auto total = static_cast<uint16_t>(KnxIpFrame::kHeaderSize + body.size());
    const auto service = to_underlying(frame.service_type());

    std::vector<uint8_t> out;
    out.reserve(total);
    out.push_back(KnxIpHeader::kHeaderLength);
    out.push_back(KnxIpHeader::kProtocolVersion);
    out.push_back(static_cast<uint8_t>(service >> 8));
    out.push_back(static_cast<uint8_t>(service & 0xFF));
    out.push_back(static_cast<uint8_t>(total >> 8));
    out.push_back(static_cast<uint8_t>(total & 0xFF));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

} // namespace KnxLink::KnxIp
