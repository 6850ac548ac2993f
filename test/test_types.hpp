/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_TEST_TEST_TYPES_HPP
#define BLOCKBLOOM_TEST_TEST_TYPES_HPP

#include <blockbloom/filter.hpp>
#include <boost/mp11/algorithm.hpp>
#include <boost/mp11/list.hpp>
#include <boost/mp11/utility.hpp>
#include "test_utilities.hpp"

using test_types=boost::mp11::mp_list<
  blockbloom::filter<>,
  blockbloom::filter<test_utilities::stateful_allocator<unsigned char>>
>;

using identity_test_types=
  boost::mp11::mp_transform<boost::mp11::mp_identity,test_types>;

#endif
