/* Error codes reported by the serializer.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_ERROR_HPP
#define BLOCKBLOOM_ERROR_HPP

#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

namespace blockbloom{

/* Specific failures. Zero is reserved for success. */

enum class error
{
  unexpected_eof=1,   /* input ended before the header or the payload did */
  bad_magic,          /* input does not start with the magic tag */
  bad_block_count,
  bad_hash_count,
  bad_comment,        /* comment not valid UTF-8 or containing NUL */
  comment_too_long,
  read_failed,        /* the stream reported an error other than EOF */
  write_failed
};

/* Families of errors callers usually discriminate on: truncated input may be
 * retried with more data, the rest may not.
 */

enum class condition
{
  truncated_input=1,
  invalid_format,
  invalid_argument,
  stream_failure
};

namespace detail{

inline const char* error_message(int ev)noexcept
{
  switch(static_cast<error>(ev)){
    case error::unexpected_eof:
      return "blockbloom: unexpected end of input";
    case error::bad_magic:
      return "blockbloom: invalid format: bad magic tag";
    case error::bad_block_count:
      return "blockbloom: invalid format: block count out of range";
    case error::bad_hash_count:
      return "blockbloom: invalid format: hash count out of range";
    case error::bad_comment:
      return "blockbloom: comment is not NUL-free UTF-8";
    case error::comment_too_long:
      return "blockbloom: comment too long";
    case error::read_failed:
      return "blockbloom: stream read failed";
    case error::write_failed:
      return "blockbloom: stream write failed";
    default:
      return "blockbloom: unknown error";
  }
}

inline const char* condition_message(int ev)noexcept
{
  switch(static_cast<condition>(ev)){
    case condition::truncated_input:  return "blockbloom: truncated input";
    case condition::invalid_format:   return "blockbloom: invalid format";
    case condition::invalid_argument: return "blockbloom: invalid argument";
    case condition::stream_failure:   return "blockbloom: stream failure";
    default:                          return "blockbloom: unknown condition";
  }
}

inline condition condition_for(error e)noexcept
{
  switch(e){
    case error::unexpected_eof:   return condition::truncated_input;
    case error::bad_magic:
    case error::bad_block_count:
    case error::bad_hash_count:
    case error::bad_comment:      return condition::invalid_format;
    case error::comment_too_long: return condition::invalid_argument;
    default:                      return condition::stream_failure;
  }
}

class io_category_impl:public boost::system::error_category
{
public:
  const char* name()const noexcept override{return "blockbloom.io";}

  std::string message(int ev)const override{return error_message(ev);}

  boost::system::error_condition default_error_condition(
    int ev)const noexcept override;
};

class condition_category_impl:public boost::system::error_category
{
public:
  const char* name()const noexcept override
  {
    return "blockbloom.condition";
  }

  std::string message(int ev)const override{return condition_message(ev);}

  bool equivalent(
    const boost::system::error_code& code,int cond)const noexcept override;
};

} /* namespace detail */

inline const boost::system::error_category& io_category()noexcept
{
  static detail::io_category_impl instance;
  return instance;
}

inline const boost::system::error_category& condition_category()noexcept
{
  static detail::condition_category_impl instance;
  return instance;
}

inline boost::system::error_code make_error_code(error e)noexcept
{
  return boost::system::error_code(static_cast<int>(e),io_category());
}

inline boost::system::error_condition make_error_condition(condition c)
  noexcept
{
  return boost::system::error_condition(
    static_cast<int>(c),condition_category());
}

namespace detail{

inline boost::system::error_condition
io_category_impl::default_error_condition(int ev)const noexcept
{
  if(ev<static_cast<int>(error::unexpected_eof)||
     ev>static_cast<int>(error::write_failed)){
    return boost::system::error_condition(ev,*this);
  }
  return make_error_condition(condition_for(static_cast<error>(ev)));
}

inline bool condition_category_impl::equivalent(
  const boost::system::error_code& code,int cond)const noexcept
{
  return code.category()==io_category()&&
    code.default_error_condition()==
      boost::system::error_condition(cond,*this);
}

} /* namespace detail */
} /* namespace blockbloom */

namespace boost{
namespace system{

template<>
struct is_error_code_enum<blockbloom::error>:std::true_type{};

template<>
struct is_error_condition_enum<blockbloom::condition>:std::true_type{};

} /* namespace system */
} /* namespace boost */

#endif
