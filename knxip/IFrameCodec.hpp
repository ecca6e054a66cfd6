/**
 * @file knxip/IFrameCodec.hpp
 * @brief Codec seam between raw datagrams and decoded frames.
 */
#pragma once

#include "KnxIpFrame.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace KnxLink::KnxIp {

/**
 * @brief Raised by IFrameCodec::decode for malformed input.
 */
class CouldNotParseKnxIp : public std::runtime_error {
public:
    explicit CouldNotParseKnxIp(const std::string& description)
        : std::runtime_error("Could not parse KNXIP: " + description) {}
};

/**
 * @brief Converts datagrams to frames and back.
 *
 * Implementations must be stateless or internally synchronized: the transport
 * decodes on the I/O thread while callers may encode from any thread.
 */
class IFrameCodec {
public:
    virtual ~IFrameCodec() = default;

    /**
     * @brief Decode one datagram.
     * @throws CouldNotParseKnxIp if the bytes are not a valid frame.
     */
    virtual KnxIpFrame decode(std::span<const uint8_t> raw) const = 0;

    /**
     * @brief Encode a frame. Total for well-formed frames.
     */
    virtual std::vector<uint8_t> encode(const KnxIpFrame& frame) const = 0;
};

} // namespace KnxLink::KnxIp
