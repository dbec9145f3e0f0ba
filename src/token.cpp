//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/token.hpp>
#include <ostream>

namespace pathway {

std::string
to_string(token const& t)
{
    std::string s;
    switch(t.kind)
    {
    case token_kind::literal:
        s = t.text;
        break;

    case token_kind::param:
        s.push_back(':');
        s.append(t.text);
        break;

    case token_kind::single_wildcard:
        s.push_back('*');
        s.append(t.text);
        break;

    case token_kind::multi_wildcard:
        s.append("**");
        s.append(t.text);
        break;

    case token_kind::extension:
        s.append("*.");
        if(t.extensions.size() == 1)
        {
            s.append(t.extensions.front());
            break;
        }
        s.push_back('{');
        for(std::size_t i = 0;
            i < t.extensions.size(); ++i)
        {
            if(i > 0)
                s.push_back(',');
            s.append(t.extensions[i]);
        }
        s.push_back('}');
        break;
    }
    return s;
}

std::ostream&
operator<<(
    std::ostream& os,
    token const& t)
{
    return os << to_string(t);
}

} // pathway
