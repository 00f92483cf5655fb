////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/discovery/protocol.hpp"
#include <cstring>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

constexpr char protocol::ACK_VALUE;
constexpr std::size_t protocol::ACK_SIZE;

std::vector<char> protocol::make_probe (std::string const & secret)
{
    return std::vector<char>(secret.begin(), secret.end());
}

std::vector<char> protocol::make_ack ()
{
    return std::vector<char>(ACK_SIZE, ACK_VALUE);
}

bool protocol::is_valid_probe (std::string const & secret, char const * data
    , std::size_t size) noexcept
{
    if (data == nullptr || size != secret.size() || size == 0)
        return false;

    return std::memcmp(secret.data(), data, size) == 0;
}

bool protocol::is_valid_ack (char const * data, std::size_t size) noexcept
{
    return data != nullptr && size == ACK_SIZE && data[0] == ACK_VALUE;
}

} // namespace discovery

LANSEEK__NAMESPACE_END
