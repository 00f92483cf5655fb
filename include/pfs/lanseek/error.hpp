////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2021.06.21 Initial version.
//      2025.03.11 Refactored.
//      2026.10.18 Discovery error conditions.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/error.hpp>
#include <string>
#include <system_error>

LANSEEK__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , invalid_argument
    , socket_error
    , poller_error
    , unexpected_error
};

class error_category : public std::error_category
{
public:
    LANSEEK__EXPORT virtual char const * name () const noexcept override;
    LANSEEK__EXPORT virtual std::string message (int ev) const override;
};

inline std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

LANSEEK__NAMESPACE_END
