////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2024-2026 Vladislav Trifochkin
//
// This file is part of `lanseek`.
//
// Changelog:
//      2024.07.29 Initial version.
//      2026.10.18 Error reporting with `errc::invalid_argument`.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "namespace.hpp"
#include <pfs/i18n.hpp>
#include <pfs/variant.hpp>
#include <map>
#include <string>

LANSEEK__NAMESPACE_BEGIN

using property_t = pfs::variant<
      bool
    , int
    , float
    , double
    , std::string>; // utf-8 encoded string

using property_map_t = std::map<std::string, property_t>;

/**
 * Returns value of the property @a key or @a default_value if property is absent.
 *
 * @throws lanseek::error (errc::invalid_argument) if stored value has a type other than @c T.
 */
template <typename T>
T get_or (property_map_t const & props, std::string const & key, T const & default_value)
{
    auto pos = props.find(key);

    if (pos == props.end())
        return default_value;

    T const * ptr = pfs::get_if<T>(& pos->second);

    if (ptr == nullptr) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("illegal value for property: {}", key)
        };
    }

    return *ptr;
}

LANSEEK__NAMESPACE_END
