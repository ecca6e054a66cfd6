/**
 * @file knxip/KnxIpCodec.hpp
 * @brief KNXnet/IP common header codec.
 */
#pragma once

#include "IFrameCodec.hpp"

namespace KnxLink::KnxIp {

/**
 * @brief Header-level KNXnet/IP codec.
 *
 * Validates the 6-byte common header (length, protocol version, known service
 * type, total length against the datagram size) and carries the body as-is.
 */
class KnxIpCodec : public IFrameCodec {
public:
    KnxIpFrame decode(std::span<const uint8_t> raw) const override;
    std::vector<uint8_t> encode(const KnxIpFrame& frame) const override;
};

} // namespace KnxLink::KnxIp
