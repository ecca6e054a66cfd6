// KnxIpFrame.hpp - KNXnet/IP frame: common header plus opaque body
#pragma once

#include "ServiceType.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

/**
 * \defgroup knxip_module KNXnet/IP Frame Module
 * \brief Header-level KNXnet/IP frame model and codec used by the UDP transport.
 */

/**
 * \file knxip/KnxIpFrame.hpp
 * \brief In-memory KNXnet/IP frame shared by the codec and the transport.
 * \ingroup knxip_module
 */

namespace KnxLink::KnxIp {

/** \brief KNXnet/IP common header (6 bytes on the wire). */
struct KnxIpHeader {
    static constexpr uint8_t kHeaderLength = 0x06;
    static constexpr uint8_t kProtocolVersion = 0x10;

    uint8_t header_length{kHeaderLength};
    uint8_t protocol_version{kProtocolVersion};
    ServiceType service_type{ServiceType::ROUTING_INDICATION};
    uint16_t total_length{kHeaderLength};   ///< Header plus body, in bytes

    bool operator==(const KnxIpHeader&) const = default;
};

/**
 * \brief Decoded KNXnet/IP frame.
 * \ingroup knxip_module
 *
 * The body is carried as raw bytes; only the service type is interpreted by
 * the transport for callback routing.
 */
class KnxIpFrame {
public:
    static constexpr std::size_t kHeaderSize = KnxIpHeader::kHeaderLength;

    KnxIpFrame() = default;

    /** \brief Build a frame for `type` carrying `body`; total length is derived from the body size. */
    KnxIpFrame(ServiceType type, std::vector<uint8_t> body);

    /** \brief Build from an already decoded header (used by the codec). */
    KnxIpFrame(const KnxIpHeader& header, std::vector<uint8_t> body)
        : header_(header), body_(std::move(body)) {}

    [[nodiscard]] ServiceType service_type() const noexcept { return header_.service_type; }
    [[nodiscard]] const KnxIpHeader& header() const noexcept { return header_; }
    [[nodiscard]] std::span<const uint8_t> body() const noexcept { return body_; }
    [[nodiscard]] uint16_t total_length() const noexcept { return header_.total_length; }

    /** \brief Replace the body and recompute the total length. */
    void set_body(std::vector<uint8_t> body);

    /** \brief Trace rendering, e.g. `<KnxIpFrame SEARCH_REQUEST (0x0201) total_length="14" body="0801..."/>`. */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const KnxIpFrame&) const = default;

private:
    KnxIpHeader header_{};
    std::vector<uint8_t> body_;
};

/** \brief Lowercase hex rendering of a byte range (no separators). */
std::string to_hex(std::span<const uint8_t> bytes);

/** \brief Inverse of to_hex; accepts either case and ignores spaces. Empty on malformed input. */
std::optional<std::vector<uint8_t>> from_hex(const std::string& text);

} // namespace KnxLink::KnxIp
