/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#include <blockbloom/filter.hpp>
#include <blockbloom/optimize.hpp>
#include <boost/core/lightweight_test.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using blockbloom::block_bits;
using blockbloom::config;
using blockbloom::optimize;

static bool close_to(double x,double y,double delta)
{
  return std::fabs(x-y)<=delta;
}

void test_optimize()
{
  {
    auto s=optimize(config{100000,0.01,0});
    BOOST_TEST_GE(s.bits,958506u);
    BOOST_TEST_EQ(s.bits%block_bits,0u);
    BOOST_TEST_GE(s.hashes,1u);
  }
  {
    /* zero capacity is taken as one */

    auto s=optimize(config{0,1.0,0});
    BOOST_TEST_EQ(s.bits,block_bits);
    BOOST_TEST_GE(s.hashes,1u);

    auto s1=optimize(config{1,1.0,0});
    BOOST_TEST_EQ(s1.bits,s.bits);
    BOOST_TEST_EQ(s1.hashes,s.hashes);
  }
  {
    /* beyond the correction table */

    auto s=optimize(config{1000,1e-12,0});
    BOOST_TEST_EQ(s.bits%block_bits,0u);
    BOOST_TEST_GE(s.bits,1000u*3*58);
  }
  for(double p:{0.5,0.1,0.01,0.001,1e-5}){
    auto s1=optimize(config{10000,p,0});
    auto s2=optimize(config{20000,p,0});
    BOOST_TEST_LE(s1.bits,s2.bits);
  }
}

/* Huge number of keys at a tiny FPR: max_bits always wins and is rounded
 * down to a whole number of blocks, never below one.
 */

void test_max_bits()
{
  struct test_case{boost::uint64_t want,expect;};
  for(const auto& c:std::vector<test_case>{
    {1,block_bits},
    {block_bits-1,block_bits},
    {block_bits+1,block_bits},
    {2*block_bits-1,block_bits},
    {(4u<<20)-1,(4u<<20)-block_bits},
    {(4u<<20)+1,4u<<20},
    {(4u<<20)+block_bits,(4u<<20)+block_bits},
  }){
    auto s=optimize(config{2*c.want,1e-10,c.want});
    BOOST_TEST_LE(s.bits,c.expect);
    BOOST_TEST_EQ(s.bits%block_bits,0u);

    blockbloom::filter<> f(s.bits,s.hashes);
    BOOST_TEST_EQ(f.num_bits(),c.expect);
  }

  for(const auto& cfg:std::vector<config>{
    {1,0.99,1},
    {100000,0.01,408}
  }){
    auto s=optimize(cfg);
    BOOST_TEST_EQ(s.bits,block_bits);
    BOOST_TEST_GE(s.hashes,1u);
  }

  /* a cap above the requirement has no effect */

  auto s1=optimize(config{100000,0.01,0});
  auto s2=optimize(config{100000,0.01,s1.bits+1});
  BOOST_TEST_EQ(s1.bits,s2.bits);
  BOOST_TEST_EQ(s1.hashes,s2.hashes);
}

void test_optimize_invalid()
{
  BOOST_TEST_THROWS(optimize(config{1,0.0,0}),std::invalid_argument);
  BOOST_TEST_THROWS(optimize(config{1,-0.5,0}),std::invalid_argument);
  BOOST_TEST_THROWS(optimize(config{1,1.0000001,0}),std::invalid_argument);
  BOOST_TEST_THROWS(
    optimize(config{1,std::numeric_limits<double>::quiet_NaN(),0}),
    std::invalid_argument);
  BOOST_TEST_THROWS(
    blockbloom::make_optimized(config{1,2.0,0}),std::invalid_argument);
}

void test_fpr_rate()
{
  using blockbloom::fpr_rate;

  BOOST_TEST_EQ(fpr_rate(0,100,3),0.0);

  /* close to one when capacity is greatly exceeded */

  BOOST_TEST(close_to(fpr_rate(1000000000,100000000,69),1.0,1e-6));

  /* Heavily overloaded single block: the leading Poisson terms underflow and
   * the mean may exceed what a double counter can step through.
   */

  double prev=0.0;
  for(boost::uint64_t n=10000;n<=10000000000000000ull;n*=10){
    double p=fpr_rate(n,512,2);
    BOOST_TEST(close_to(p,1.0,1e-3));
    BOOST_TEST_GE(p,prev);
    BOOST_TEST_LE(p,1.0);
    prev=p;
  }
  BOOST_TEST(close_to(fpr_rate(1000000000000,512,2),1.0,1e-3));
  BOOST_TEST_EQ(fpr_rate(10000000000000000ull,512,2),1.0);
  BOOST_TEST_EQ(fpr_rate(~boost::uint64_t(0),512,2),1.0);
  BOOST_TEST(close_to(fpr_rate(20000,512,14),1.0,1e-9));

  /* examples from Putze et al., page 4 */

  BOOST_TEST(close_to(fpr_rate(1,8,5),0.0231,6e-5));
  BOOST_TEST(close_to(fpr_rate(1,20,14),1.94e-4,3e-5));

  BOOST_TEST_THROWS(fpr_rate(10,0,2),std::invalid_argument);
  BOOST_TEST_THROWS(fpr_rate(10,2,0),std::invalid_argument);

  /* more keys, more false positives */

  prev=0.0;
  for(boost::uint64_t n:{1000u,2000u,4000u,8000u}){
    double p=fpr_rate(n,65536,7);
    BOOST_TEST_GT(p,prev);
    BOOST_TEST_LE(p,1.0);
    prev=p;
  }

  blockbloom::filter<> f(100000,7);
  BOOST_TEST_EQ(f.fpr_rate(10000),fpr_rate(10000,f.num_bits(),7));
}

/* The correction table can be rebuilt, give or take one, by searching for
 * the smallest c' at which a blocked filter matches the FPR of a classical
 * filter with c bits per key.
 */

void test_correction_table()
{
  namespace detail=blockbloom::detail;

  for(std::size_t i=1;i<detail::correct_c_size;++i){
    double c=(double)i;
    double k=c*detail::ln2;
    double fpr_classical=std::exp(detail::log_fpr_block(c,k));

    double cprime=c;
    for(;;){
      if(detail::fpr_rate_c(cprime,k)<=fpr_classical)break;
      cprime+=1.0;
      k=cprime*detail::ln2;
    }
    BOOST_TEST(close_to((double)detail::correct_c[i],cprime,1.0));
  }
}

/* Filters built from optimize meet the requested FPR on average. */

void test_optimize_meets_fpr()
{
  for(double p:{0.1,0.01,0.001}){
    auto s=optimize(config{50000,p,0});
    BOOST_TEST_LE(
      blockbloom::fpr_rate(50000,s.bits,s.hashes<2?2:s.hashes),p*1.5);
  }
}

int main()
{
  test_optimize();
  test_max_bits();
  test_optimize_invalid();
  test_fpr_rate();
  test_correction_table();
  test_optimize_meets_fpr();
  return boost::report_errors();
}
