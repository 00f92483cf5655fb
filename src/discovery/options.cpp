////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2026.10.18 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/discovery/options.hpp"
#include <pfs/i18n.hpp>

LANSEEK__NAMESPACE_BEGIN

namespace discovery {

constexpr std::size_t options::MAX_SECRET_SIZE;

static inet4_addr parse_addr_property (property_map_t const & props, std::string const & key
    , inet4_addr const & default_value)
{
    auto text = get_or(props, key, std::string{});

    if (text.empty())
        return default_value;

    auto res = inet4_addr::parse(text);

    if (!res) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("bad address for property: {}: {}", key, text)
        };
    }

    return *res;
}

options load_options (property_map_t const & props)
{
    options opts;

    opts.secret = get_or(props, "secret", opts.secret);

    auto port = get_or(props, "port", static_cast<int>(opts.port));

    if (port < 0 || port > 65535) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("discovery port out of range: {}", port)
        };
    }

    opts.port = static_cast<std::uint16_t>(port);
    opts.interval = std::chrono::milliseconds{get_or(props, "interval"
        , static_cast<int>(opts.interval.count()))};
    opts.timeout = std::chrono::milliseconds{get_or(props, "timeout"
        , static_cast<int>(opts.timeout.count()))};
    opts.automatic = get_or(props, "automatic", opts.automatic);
    opts.single_result = get_or(props, "single_result", opts.single_result);
    opts.target_addr = parse_addr_property(props, "target_addr", opts.target_addr);
    opts.listener_addr = parse_addr_property(props, "listener_addr", opts.listener_addr);

    return opts;
}

options normalize (options const & opts)
{
    if (opts.secret.empty()) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("discovery secret must not be empty")
        };
    }

    if (opts.secret.size() > options::MAX_SECRET_SIZE) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("discovery secret too long: {} bytes, maximum is {}"
                , opts.secret.size(), options::MAX_SECRET_SIZE)
        };
    }

    if (opts.port == 0) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("discovery port must be in range [1, 65535]")
        };
    }

    options result = opts;
    std::chrono::milliseconds const min_duration {1};

    if (result.interval < min_duration)
        result.interval = min_duration;

    if (result.timeout < min_duration)
        result.timeout = min_duration;

    return result;
}

} // namespace discovery

LANSEEK__NAMESPACE_END
