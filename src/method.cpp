//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/method.hpp>
#include <ostream>

namespace pathway {

method
string_to_method(
    core::string_view s) noexcept
{
    switch(s.size())
    {
    case 3:
        if(s == "GET")
            return method::get;
        if(s == "PUT")
            return method::put;
        break;

    case 4:
        if(s == "HEAD")
            return method::head;
        if(s == "POST")
            return method::post;
        break;

    case 5:
        if(s == "PATCH")
            return method::patch;
        if(s == "TRACE")
            return method::trace;
        break;

    case 6:
        if(s == "DELETE")
            return method::delete_;
        break;

    case 7:
        if(s == "CONNECT")
            return method::connect;
        if(s == "OPTIONS")
            return method::options;
        break;

    default:
        break;
    }
    return method::unknown;
}

core::string_view
to_string(method v) noexcept
{
    switch(v)
    {
    case method::delete_:   return "DELETE";
    case method::get:       return "GET";
    case method::head:      return "HEAD";
    case method::post:      return "POST";
    case method::put:       return "PUT";
    case method::connect:   return "CONNECT";
    case method::options:   return "OPTIONS";
    case method::trace:     return "TRACE";
    case method::patch:     return "PATCH";
    default:
        return "<unknown>";
    }
}

std::ostream&
operator<<(
    std::ostream& os,
    method v)
{
    return os << to_string(v);
}

} // pathway
