/* Sizing of blocked Bloom filters.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_OPTIMIZE_HPP
#define BLOCKBLOOM_OPTIMIZE_HPP

#include <blockbloom/block.hpp>
#include <blockbloom/detail/core.hpp>
#include <boost/cstdint.hpp>
#include <boost/throw_exception.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace blockbloom{

/* Parameters for optimize and make_optimized. */

struct config
{
  /* expected number of distinct keys */
  boost::uint64_t capacity;

  /* desired upper bound on the false positive rate once capacity keys have
   * been added, in (0,1]
   */
  double fp_rate;

  /* maximum size of the filter in bits, zero means no limit */
  boost::uint64_t max_bits;
};

struct sizing
{
  boost::uint64_t bits;
  std::size_t     hashes;
};

namespace detail{

/* ln(2) */
static constexpr double ln2=0.69314718055994530941723212145817656807550013436;

/* correct_c maps the bits per key c=m/n of a classical Bloom filter to the c'
 * a blocked filter needs for the same FPR. This is Table I of Putze, Sanders
 * and Singler, "Cache-, Hash- and Space-Efficient Bloom Filters" (2007),
 * extended down to zero. Beyond c=34 the values grow too fast to be useful.
 */

static constexpr unsigned char correct_c[]={
   1,  1,  2,  4,  5,
   6,  7,  8,  9, 10, 11, 12, 13, 14, 16, 17, 18, 20, 21, 23,
  25, 26, 28, 30, 32, 35, 38, 40, 44, 48, 51, 58, 64, 74, 90,
};

static constexpr std::size_t correct_c_size=
  sizeof(correct_c)/sizeof(correct_c[0]);

/* log of the Poisson pmf */

inline double log_poisson(double lambda,double i)
{
  return i*std::log(lambda)-lambda-std::lgamma(i+1.0);
}

/* log of the FPR of a single classical Bloom filter with c bits per key and
 * k hash functions
 */

inline double log_fpr_block(double c,double k)
{
  return k*std::log1p(-std::exp(-k/c));
}

/* FPR of a blocked filter with c bits per key and k hash functions, as the
 * sum over block occupancies i of Poisson(block_bits/c)(i) times the FPR of
 * a block holding i keys.
 */

static constexpr std::size_t max_fpr_terms=100000;

inline double fpr_rate_c(double c,double k)
{
  const double lambda=(double)block_bits/c;
  const double sigma=std::sqrt(lambda);

  /* The FPR of a block holding 40*block_bits keys or more rounds to 1 in
   * double precision, whatever k. If nearly all blocks are that full, so is
   * the filter's. This also keeps the number of terms below max_fpr_terms.
   */

  if(lambda-10.0*sigma>=40.0*(double)block_bits)return 1.0;

  /* Poisson terms more than 40 standard deviations below the mean underflow
   * to zero, so skip them.
   */

  double i0=std::floor(lambda-40.0*sigma);
  if(i0<0.0)i0=0.0;

  double sum=0.0;
  double deltap=0.0;
  for(std::size_t n=0;n<max_fpr_terms;++n){
    const double i=i0+(double)n;
    double delta=std::exp(
      log_poisson(lambda,i)+log_fpr_block((double)block_bits/i,k));
    double sumn=sum+delta;

    /* Terms grow up to the Poisson mode at least, so only stop on the
     * descending slope past it.
     */

    if(i>lambda&&delta<deltap&&sumn==sum)break;
    deltap=delta;
    sum=sumn;
  }
  return (std::min)(sum,1.0);
}

inline boost::uint64_t round_up_to_block(boost::uint64_t bits)
{
  return bits%block_bits?bits+(block_bits-bits%block_bits):bits;
}

} /* namespace detail */

/* Computes the numbers of bits and hash functions that achieve the false
 * positive rate described by cfg, capped at cfg.max_bits when that is
 * non-zero. bits is always a non-zero multiple of block_bits. When the cap
 * kicks in the resulting filter has a higher FPR than requested, never more
 * memory than allowed.
 *
 * Throws std::invalid_argument if cfg.fp_rate is not in (0,1].
 */

inline sizing optimize(const config& cfg)
{
  if(!(cfg.fp_rate>0.0&&cfg.fp_rate<=1.0)){
    BOOST_THROW_EXCEPTION(std::invalid_argument(
      "false positive rate for a Bloom filter must be > 0, <= 1"));
  }

  /* Assume at least one key will be added, as log2(0)=-inf. */

  const double n=cfg.capacity?(double)cfg.capacity:1.0;

  /* c=-log2(p)/ln(2) is optimal for a classical Bloom filter. */

  double c=std::ceil(-std::log2(cfg.fp_rate)/detail::ln2);
  if(c<(double)detail::correct_c_size){
    c=detail::correct_c[(std::size_t)c];
  }
  else{
    /* Desired FPR is beyond the table: just triple the number of bits. */
    c*=3;
  }

  boost::uint64_t limit=max_bits;
  if(cfg.max_bits!=0&&cfg.max_bits<limit)limit=cfg.max_bits;

  const double    m=std::ceil(c*n);
  boost::uint64_t bits=m>=(double)limit?
    limit:detail::round_up_to_block((boost::uint64_t)m);
  if(bits>=limit){
    /* round down to a multiple of block_bits, never below one block */
    bits=limit-limit%block_bits;
    if(bits<block_bits)bits=block_bits;
  }

  /* The optimal number of hash functions is k=c*ln(2). */

  double k=std::round((double)bits/n*detail::ln2);
  return {bits,k<1.0?std::size_t(1):(std::size_t)k};
}

/* Estimates the false positive rate of a filter of the given shape after
 * capacity distinct keys have been added (Putze et al.'s equation (3),
 * computed in log space).
 *
 * Returns 0 for capacity==0. Throws std::invalid_argument if bits or hashes
 * is zero.
 */

inline double fpr_rate(
  boost::uint64_t capacity,boost::uint64_t bits,std::size_t hashes)
{
  if(bits==0){
    BOOST_THROW_EXCEPTION(std::invalid_argument("number of bits must be > 0"));
  }
  if(hashes==0){
    BOOST_THROW_EXCEPTION(
      std::invalid_argument("number of hashes must be > 0"));
  }
  if(capacity==0)return 0.0;

  return detail::fpr_rate_c((double)bits/(double)capacity,(double)hashes);
}

} /* namespace blockbloom */
#endif
