//
// Copyright (c) 2026 Pathway contributors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_HPP
#define PATHWAY_HPP

#include <pathway/error.hpp>
#include <pathway/logger.hpp>
#include <pathway/match.hpp>
#include <pathway/method.hpp>
#include <pathway/params.hpp>
#include <pathway/path.hpp>
#include <pathway/pattern.hpp>
#include <pathway/route_snapshot.hpp>
#include <pathway/route_table.hpp>
#include <pathway/router.hpp>
#include <pathway/token.hpp>

#endif
