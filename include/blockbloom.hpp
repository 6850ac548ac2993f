/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_HPP
#define BLOCKBLOOM_HPP

#include <blockbloom/block.hpp>
#include <blockbloom/error.hpp>
#include <blockbloom/filter.hpp>
#include <blockbloom/io.hpp>
#include <blockbloom/optimize.hpp>
#include <blockbloom/sync_filter.hpp>

#endif
