/* Throughput table for blockbloom::filter at several bits-per-key ratios.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#include <algorithm>
#include <array>
#include <chrono>
#include <numeric>

std::chrono::high_resolution_clock::time_point measure_start,measure_pause;

template<typename F>
double measure(F f)
{
  using namespace std::chrono;

  static const int              num_trials=10;
  static const milliseconds     min_time_per_trial(10);
  std::array<double,num_trials> trials;

  for(int i=0;i<num_trials;++i){
    int                               runs=0;
    high_resolution_clock::time_point t2;
    volatile decltype(f())            res; /* to avoid optimizing f() away */

    measure_start=high_resolution_clock::now();
    do{
      res=f();
      ++runs;
      t2=high_resolution_clock::now();
    }while(t2-measure_start<min_time_per_trial);
    trials[i]=duration_cast<duration<double>>(t2-measure_start).count()/runs;
  }

  std::sort(trials.begin(),trials.end());
  return std::accumulate(
    trials.begin()+2,trials.end()-2,0.0)/(trials.size()-4);
}

void pause_timing()
{
  measure_pause=std::chrono::high_resolution_clock::now();
}

void resume_timing()
{
  measure_start+=std::chrono::high_resolution_clock::now()-measure_pause;
}

#include <blockbloom/detail/set_ops.hpp>
#include <blockbloom/filter.hpp>
#include <boost/cstdint.hpp>
#include <boost/unordered_set.hpp>
#include <iomanip>
#include <iostream>
#include <vector>

static constexpr std::size_t N=1000000;

struct splitmix64
{
  boost::uint64_t operator()()
  {
    boost::uint64_t z=(state+=0x9e3779b97f4a7c15ull);
    z=(z^(z>>30))*0xbf58476d1ce4e5b9ull;
    z=(z^(z>>27))*0x94d049bb133111ebull;
    return z^(z>>31);
  }

  boost::uint64_t state=0;
};

struct test_results
{
  double fpr;                      /* % */
  double add_time;                 /* ns per element */
  double add_atomic_time;          /* ns per element */
  double successful_lookup_time;   /* ns per element */
  double unsuccessful_lookup_time; /* ns per element */
  double union_time;               /* ns per block */
};

struct test_data
{
  test_data()
  {
    splitmix64                            rng;
    boost::unordered_set<boost::uint64_t> unique;
    while(data_in.size()<N){
      auto x=rng();
      if(unique.insert(x).second)data_in.push_back(x);
    }
    while(data_out.size()<N){
      auto x=rng();
      if(!unique.count(x))data_out.push_back(x);
    }
  }

  std::vector<boost::uint64_t> data_in,data_out;
};

test_results test(const test_data& d,std::size_t c,std::size_t k)
{
  using filter=blockbloom::filter<>;

  double fpr=0.0;
  {
    std::size_t res=0;
    filter f(c*N,k);
    for(auto x:d.data_in)f.add(x);
    for(auto x:d.data_out)res+=f.has(x);
    fpr=(double)res*100/N;
  }

  double add_time=0.0,add_atomic_time=0.0;
  {
    double t=measure([&]{
      pause_timing();
      {
        filter f(c*N,k);
        resume_timing();
        for(auto x:d.data_in)f.add(x);
        pause_timing();
      }
      resume_timing();
      return 0;
    });
    add_time=t/N*1E9;
    t=measure([&]{
      pause_timing();
      {
        filter f(c*N,k);
        resume_timing();
        for(auto x:d.data_in)f.add_atomic(x);
        pause_timing();
      }
      resume_timing();
      return 0;
    });
    add_atomic_time=t/N*1E9;
  }

  double successful_lookup_time=0.0;
  double unsuccessful_lookup_time=0.0;
  double union_time=0.0;
  {
    filter f(c*N,k);
    for(auto x:d.data_in)f.add(x);
    double t=measure([&]{
      std::size_t res=0;
      for(auto x:d.data_in)res+=f.has(x);
      return res;
    });
    successful_lookup_time=t/N*1E9;
    t=measure([&]{
      std::size_t res=0;
      for(auto x:d.data_out)res+=f.has(x);
      return res;
    });
    unsuccessful_lookup_time=t/N*1E9;

    filter g(c*N,k);
    for(auto x:d.data_out)g.add(x);
    t=measure([&]{
      g.union_with(f);
      return 0;
    });
    union_time=t/f.num_blocks()*1E9;
  }

  return {
    fpr,add_time,add_atomic_time,
    successful_lookup_time,unsuccessful_lookup_time,union_time};
}

struct print_double
{
  print_double(double x_,int precision_=2):x{x_},precision{precision_}{}

  friend std::ostream& operator<<(std::ostream& os,const print_double& pd)
  {
    const auto default_precision=std::cout.precision();
    os<<std::fixed<<std::setprecision(pd.precision)<<pd.x;
    std::cout.unsetf(std::ios::fixed);
    os<<std::setprecision(default_precision);
    return os;
  }

  double x;
  int    precision;
};

void row(const test_data& d,std::size_t c,std::size_t k)
{
  auto res=test(d,c,k);
  std::cout<<
    "  <tr>\n"
    "    <td align=\"center\">"<<c<<"</td>\n"
    "    <td align=\"center\">"<<k<<"</td>\n"
    "    <td align=\"right\">"<<print_double(res.fpr,4)<<"</td>\n"
    "    <td align=\"right\">"<<print_double(res.add_time)<<"</td>\n"
    "    <td align=\"right\">"<<print_double(res.add_atomic_time)<<"</td>\n"
    "    <td align=\"right\">"<<print_double(res.successful_lookup_time)<<"</td>\n"
    "    <td align=\"right\">"<<print_double(res.unsuccessful_lookup_time)<<"</td>\n"
    "    <td align=\"right\">"<<print_double(res.union_time)<<"</td>\n"
    "  </tr>\n";
}

int main()
{
  test_data d;

  std::cout<<
#if defined(BLOCKBLOOM_SIMD_SET_OPS)
    "<p>SIMD set operations</p>\n"
#else
    "<p>portable set operations</p>\n"
#endif
    "<table>\n"
    "  <tr>\n"
    "    <th>c</th>\n"
    "    <th>K</th>\n"
    "    <th>FPR [%]</th>\n"
    "    <th>add</th>\n"
    "    <th>add_atomic</th>\n"
    "    <th>succ.</br>lookup</th>\n"
    "    <th>unsucc.</br>lookup</th>\n"
    "    <th>union</br>[ns/block]</th>\n"
    "  </tr>\n";

  row(d,8,6);
  row(d,12,9);
  row(d,16,11);
  row(d,20,14);

  std::cout<<"</table>\n";
}
