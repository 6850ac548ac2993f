/* Saving and restoring a blockbloom::filter.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#include <blockbloom/filter.hpp>
#include <blockbloom/io.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/cstdint.hpp>
#include <boost/system/error_code.hpp>
#include <boost/uuid/uuid.hpp>
#include <cstring>
#include <fstream>
#include <iostream>

/* emits a deterministic pseudorandom sequence of UUIDs */

struct uuid_generator
{
  boost::uuids::uuid operator()()
  {
    boost::uuids::uuid id;
    boost::uint64_t    x = rng();
    std::memcpy(&id.data[0], &x, sizeof(x));
    x = rng();
    std::memcpy(&id.data[8], &x, sizeof(x));
    return id;
  }

  boost::uint64_t rng()
  {
    boost::uint64_t z = (state += 0x9e3779b97f4a7c15ull);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
  }

  boost::uint64_t state = 0;
};

/* filters work on 64-bit hashes, computed here with Boost.ContainerHash */

inline boost::uint64_t hash_of(const boost::uuids::uuid& id)
{
  return boost::hash<boost::uuids::uuid>()(id);
}

static constexpr std::size_t num_elements = 10000;

blockbloom::filter<> create_filter()
{
  uuid_generator gen;
  auto           f = blockbloom::make_optimized(
    blockbloom::config{num_elements, 0.005, 0});
  for(std::size_t i = 0; i < num_elements; ++i) f.add(hash_of(gen()));
  return f;
}

static constexpr const char* filename = "filter.bin";

void save_filter(const blockbloom::filter<>& f)
{
  std::ofstream out(filename, std::ios::binary | std::ios::trunc);
  auto n = blockbloom::dump(out, f, "10000 UUIDs");
  std::cout << "saved " << n << " bytes\n";
}

bool load_filter(blockbloom::filter<>& f)
{
  std::ifstream             in(filename, std::ios::binary);
  boost::system::error_code ec;
  blockbloom::loader        l(in, ec);
  if (ec) {
    std::cout << "bad header: " << ec.message() << "\n";
    return false;
  }

  /* header is available before the blocks are read */

  std::cout << "comment: \"" << l.comment() << "\", "
            << l.num_bits() << " bits, " << l.num_hashes() << " hashes\n";

  l.load(f, ec);
  if (ec) {
    std::cout << "load failed: " << ec.message() << "\n";
    return false;
  }
  return true;
}

int main()
{
  save_filter(create_filter());

  blockbloom::filter<> f(blockbloom::block_bits, 2);
  if (!load_filter(f)) return 1;

  /* Check that all the UUIDs used on filter creation are actually contained
   * in the restored filter.
   */

  uuid_generator  gen;
  std::size_t     n = 0;
  for(std::size_t i = 0; i < num_elements; ++i) {
    if (f.has(hash_of(gen()))) ++n;
  }
  if (n == num_elements) std::cout << "all elements in filter\n";
  else                   std::cout << "something went wrong\n";
  std::cout << "estimated cardinality: " << f.cardinality() << "\n";
}
