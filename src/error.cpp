////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2023.01.01 Initial version
////////////////////////////////////////////////////////////////////////////////
#include "pfs/lanseek/error.hpp"
#include <pfs/i18n.hpp>

LANSEEK__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "lanseek::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::invalid_argument:
            return tr::_("invalid argument");
        case errc::socket_error:
            return tr::_("socket error");
        case errc::poller_error:
            return tr::_("poller error");
        case errc::unexpected_error:
            return tr::_("unexpected error");

        default: return tr::_("unknown discovery error");
    }
}

LANSEEK__NAMESPACE_END
