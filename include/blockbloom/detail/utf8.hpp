/* Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_UTF8_HPP
#define BLOCKBLOOM_DETAIL_UTF8_HPP

#include <cstddef>

namespace blockbloom{
namespace detail{

/* Strict UTF-8 validation (RFC 3629): rejects overlong encodings, UTF-16
 * surrogates and code points above U+10FFFF.
 */

inline bool is_valid_utf8(const char* data,std::size_t len)noexcept
{
  const unsigned char* p=reinterpret_cast<const unsigned char*>(data);
  std::size_t          i=0;

  while(i<len){
    unsigned char c=p[i];
    std::size_t   n;
    unsigned char lo=0x80,hi=0xBF; /* allowed range of the second byte */

    if(c<0x80){++i;continue;}
    else if(c>=0xC2&&c<=0xDF)n=1;
    else if(c>=0xE0&&c<=0xEF){
      n=2;
      if(c==0xE0)lo=0xA0;
      else if(c==0xED)hi=0x9F;
    }
    else if(c>=0xF0&&c<=0xF4){
      n=3;
      if(c==0xF0)lo=0x90;
      else if(c==0xF4)hi=0x8F;
    }
    else return false;

    if(len-i<=n)return false;
    if(p[i+1]<lo||p[i+1]>hi)return false;
    for(std::size_t j=2;j<=n;++j){
      if((p[i+j]&0xC0)!=0x80)return false;
    }
    i+=n+1;
  }
  return true;
}

} /* namespace detail */
} /* namespace blockbloom */
#endif
