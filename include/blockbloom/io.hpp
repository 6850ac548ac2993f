/* Binary serialization of blockbloom::filter.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_IO_HPP
#define BLOCKBLOOM_IO_HPP

#include <blockbloom/block.hpp>
#include <blockbloom/detail/core.hpp>
#include <blockbloom/detail/utf8.hpp>
#include <blockbloom/error.hpp>
#include <blockbloom/filter.hpp>
#include <boost/cstdint.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <cstddef>
#include <cstring>
#include <istream>
#include <limits>
#include <memory>
#include <ostream>
#include <string>

/* Layout of a dumped filter, all of it in a 64-byte header followed by the
 * blocks:
 *
 *   offset  size  contents
 *        0     8  magic tag "blobloom"
 *        8     8  number of blocks, big endian
 *       16     8  number of hash functions, big endian
 *       24    40  UTF-8 comment, NUL-padded
 *       64         blocks, each as 16 little-endian 32-bit words
 *
 * Little-endian words make byte i/8 of a block hold bit i, whatever the word
 * size the reader uses.
 */

namespace blockbloom{

static constexpr std::size_t max_comment_size=40;

namespace detail{

static constexpr char        magic[8]={'b','l','o','b','l','o','o','m'};
static constexpr std::size_t header_size=64;
static constexpr std::size_t comment_offset=24;
static constexpr std::size_t max_hashes=0xFFFFFFFFul;
static constexpr std::size_t blocks_per_chunk=64;

static_assert(
  comment_offset+max_comment_size==header_size,"header layout mismatch");

inline void store_be64(unsigned char* p,boost::uint64_t x)noexcept
{
  x=boost::endian::native_to_big(x);
  std::memcpy(p,&x,sizeof(x));
}

inline boost::uint64_t load_be64(const unsigned char* p)noexcept
{
  boost::uint64_t x;
  std::memcpy(&x,p,sizeof(x));
  return boost::endian::big_to_native(x);
}

inline void store_block(unsigned char* p,const block& b)noexcept
{
  for(std::size_t n=0;n<block::num_words;++n){
    block::word_type w=boost::endian::native_to_little(b.words[n]);
    std::memcpy(p+n*sizeof(w),&w,sizeof(w));
  }
}

inline void block_from_little(block& b)noexcept
{
  for(std::size_t n=0;n<block::num_words;++n){
    b.words[n]=boost::endian::little_to_native(b.words[n]);
  }
}

/* Reads exactly n bytes. A stream ending early is reported as
 * unexpected_eof, any other failure as read_failed.
 */

inline bool read_exactly(
  std::istream& is,char* p,std::size_t n,boost::system::error_code& ec)
{
  is.read(p,static_cast<std::streamsize>(n));
  if(static_cast<std::size_t>(is.gcount())!=n){
    ec=is.eof()?error::unexpected_eof:error::read_failed;
    return false;
  }
  return true;
}

inline void throw_if_error(
  const boost::system::error_code& ec,const char* location)
{
  if(ec)BOOST_THROW_EXCEPTION(boost::system::system_error(ec,location));
}

} /* namespace detail */

/* Writes f to os along with comment, which must be NUL-free UTF-8 of at most
 * max_comment_size bytes. Returns the number of bytes written: with no error,
 * 64 for the header plus 64 per block. On error, nothing is written if the
 * comment is rejected, and a prefix of the output may have been written if
 * the stream fails.
 */

template<typename Allocator>
boost::uint64_t dump(
  std::ostream& os,const filter<Allocator>& f,const std::string& comment,
  boost::system::error_code& ec)
{
  ec.clear();
  if(comment.size()>max_comment_size){
    ec=error::comment_too_long;
    return 0;
  }
  if(comment.find('\0')!=std::string::npos||
     !detail::is_valid_utf8(comment.data(),comment.size())){
    ec=error::bad_comment;
    return 0;
  }

  unsigned char header[detail::header_size]={};
  std::memcpy(header,detail::magic,sizeof(detail::magic));
  detail::store_be64(header+8,f.num_blocks());
  detail::store_be64(header+16,f.k());
  std::memcpy(header+detail::comment_offset,comment.data(),comment.size());
  if(!os.write(reinterpret_cast<const char*>(header),sizeof(header))){
    ec=error::write_failed;
    return 0;
  }
  boost::uint64_t res=sizeof(header);

  unsigned char buf[detail::blocks_per_chunk*sizeof(block)];
  const block*  p=f.blocks();
  for(std::size_t i=0;i<f.num_blocks();){
    std::size_t m=f.num_blocks()-i;
    if(m>detail::blocks_per_chunk)m=detail::blocks_per_chunk;
    for(std::size_t j=0;j<m;++j){
      detail::store_block(buf+j*sizeof(block),p[i+j]);
    }
    if(!os.write(reinterpret_cast<const char*>(buf),
                 static_cast<std::streamsize>(m*sizeof(block)))){
      ec=error::write_failed;
      return res;
    }
    res+=m*sizeof(block);
    i+=m;
  }
  return res;
}

/* Throws boost::system::system_error on failure. */

template<typename Allocator>
boost::uint64_t dump(
  std::ostream& os,const filter<Allocator>& f,const std::string& comment)
{
  boost::system::error_code ec;
  auto                      res=dump(os,f,comment,ec);
  detail::throw_if_error(ec,"blockbloom::dump");
  return res;
}

/* loader reads a dumped filter in two steps: construction parses and
 * validates the header only, so that callers can inspect comment() and the
 * declared size before any memory for the blocks is committed; load then
 * reads the blocks.
 *
 * Header errors are thrown as boost::system::system_error by the
 * single-argument constructor and reported through ec by the other one; in
 * the latter case every subsequent load fails with the same error. Loading
 * never throws on bad input when an error_code is passed, though allocating
 * the filter may throw std::bad_alloc.
 */

class loader
{
public:
  explicit loader(std::istream& is_):is(is_)
  {
    read_header(hdr_ec);
    detail::throw_if_error(hdr_ec,"blockbloom::loader");
  }

  loader(std::istream& is_,boost::system::error_code& ec):is(is_)
  {
    read_header(hdr_ec);
    ec=hdr_ec;
  }

  const std::string& comment()const noexcept{return cmt;}
  boost::uint64_t    num_blocks()const noexcept{return nb;}
  std::size_t        num_hashes()const noexcept{return kh;}
  boost::uint64_t    num_bits()const noexcept{return nb*block_bits;}

  /* Reads the blocks into f, which takes the loaded shape. f's storage is
   * reused if it already has num_blocks() blocks. On error f is left empty.
   */

  template<typename Allocator>
  void load(filter<Allocator>& f,boost::system::error_code& ec)
  {
    ec=hdr_ec;
    if(ec)return;

    f.reset(static_cast<std::size_t>(nb),kh);
    block* p=f.blocks();
    if(!detail::read_exactly(
      is,reinterpret_cast<char*>(p),
      static_cast<std::size_t>(nb)*sizeof(block),ec)){
      f.clear();
      return;
    }
    for(std::size_t i=0;i<nb;++i)detail::block_from_little(p[i]);
  }

  template<typename Allocator>
  void load(filter<Allocator>& f)
  {
    boost::system::error_code ec;
    load(f,ec);
    detail::throw_if_error(ec,"blockbloom::loader::load");
  }

  /* Allocating versions. The error_code one returns an empty optional on
   * failure.
   */

  template<typename Allocator=std::allocator<unsigned char>>
  boost::optional<filter<Allocator>> load(boost::system::error_code& ec)
  {
    boost::optional<filter<Allocator>> res;
    ec=hdr_ec;
    if(ec)return res;

    res.emplace(num_bits(),kh);
    load(*res,ec);
    if(ec)res=boost::none;
    return res;
  }

  template<typename Allocator=std::allocator<unsigned char>>
  filter<Allocator> load()
  {
    detail::throw_if_error(hdr_ec,"blockbloom::loader::load");
    filter<Allocator> f{num_bits(),kh};
    load(f);
    return f;
  }

private:
  void read_header(boost::system::error_code& ec)
  {
    ec.clear();

    unsigned char header[detail::header_size];
    if(!detail::read_exactly(
      is,reinterpret_cast<char*>(header),sizeof(header),ec))return;
    if(std::memcmp(header,detail::magic,sizeof(detail::magic))!=0){
      ec=error::bad_magic;
      return;
    }

    boost::uint64_t nblocks=detail::load_be64(header+8);
    if(nblocks==0||nblocks>max_blocks||
       nblocks>(std::numeric_limits<std::size_t>::max)()/sizeof(block)){
      ec=error::bad_block_count;
      return;
    }

    boost::uint64_t nhashes=detail::load_be64(header+16);
    if(nhashes<2||nhashes>detail::max_hashes){
      ec=error::bad_hash_count;
      return;
    }

    /* NUL-padded: everything past the first NUL must be NUL too */

    const char* c=reinterpret_cast<const char*>(header+detail::comment_offset);
    std::size_t len=0;
    while(len<max_comment_size&&c[len]!='\0')++len;
    for(std::size_t i=len;i<max_comment_size;++i){
      if(c[i]!='\0'){
        ec=error::bad_comment;
        return;
      }
    }
    if(!detail::is_valid_utf8(c,len)){
      ec=error::bad_comment;
      return;
    }

    nb=nblocks;
    kh=static_cast<std::size_t>(nhashes);
    cmt.assign(c,len);
  }

  std::istream&             is;
  boost::uint64_t           nb=0;
  std::size_t               kh=0;
  std::string               cmt;
  boost::system::error_code hdr_ec;
};

} /* namespace blockbloom */
#endif
