#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>

#include <linkguard/core/status.h>

namespace linkguard::net::dns {

// RFC 1035 wire format, A queries only.
constexpr std::uint16_t kTypeA = 1;
constexpr std::uint16_t kClassIn = 1;
constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxUdpPayload = 4096;

// Recursion desired, one question.
linkguard::Result<std::vector<std::uint8_t>> BuildQuery(std::uint16_t id, std::string_view domain);

struct Response {
    std::uint16_t id = 0;
    std::uint8_t rcode = 0;
    bool truncated = false;
    std::vector<boost::asio::ip::address_v4> addresses; // IN A answers, in order
};

// Reads the transaction id without validating the rest of the message.
bool PeekId(const std::uint8_t* data, std::size_t size, std::uint16_t& id);

linkguard::Result<Response> ParseResponse(const std::uint8_t* data, std::size_t size);

std::string_view RcodeName(std::uint8_t rcode);

} // namespace linkguard::net::dns
