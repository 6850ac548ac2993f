/* Storage shared by all blockbloom::filter instantiations.
 *
 * Copyright 2025 Joaquin M Lopez Munoz.
 * Distributed under the Boost Software License, Version 1.0.
 * (See accompanying file LICENSE_1_0.txt or copy at
 * http://www.boost.org/LICENSE_1_0.txt)
 */

#ifndef BLOCKBLOOM_DETAIL_CORE_HPP
#define BLOCKBLOOM_DETAIL_CORE_HPP

#include <blockbloom/block.hpp>
#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/core/allocator_access.hpp>
#include <boost/core/empty_value.hpp>
#include <boost/cstdint.hpp>
#include <cstddef>
#include <cstring>
#include <tuple>
#include <type_traits>
#include <utility>

namespace blockbloom{

/* Maximum number of blocks and bits of a filter. Block indexes are derived
 * from a 32-bit half of the hash, so more blocks could not be addressed.
 */

static constexpr boost::uint64_t max_blocks=boost::uint64_t(1)<<32;
static constexpr boost::uint64_t max_bits=max_blocks*block_bits;

namespace detail{

struct filter_array
{
  unsigned char* data;
  block*         blocks; /* adjusted from data for proper alignment */
};

struct if_constexpr_void_else{void operator()()const{}};

template<bool B,typename F,typename G=if_constexpr_void_else>
void if_constexpr(F f,G g={})
{
  std::get<B?0:1>(std::forward_as_tuple(f,g))();
}

template<bool B,typename T,typename std::enable_if<B>::type* =nullptr>
void copy_assign_if(T& x,const T& y){x=y;}

template<bool B,typename T,typename std::enable_if<!B>::type* =nullptr>
void copy_assign_if(T&,const T&){}

template<bool B,typename T,typename std::enable_if<B>::type* =nullptr>
void move_assign_if(T& x,T& y){x=std::move(y);}

template<bool B,typename T,typename std::enable_if<!B>::type* =nullptr>
void move_assign_if(T&,T&){}

template<bool B,typename T,typename std::enable_if<B>::type* =nullptr>
void swap_if(T& x,T& y){using std::swap; swap(x,y);}

template<bool B,typename T,typename std::enable_if<!B>::type* =nullptr>
void swap_if(T&,T&){}

/* filter_core owns a 64-byte aligned array of num_blocks() blocks plus the
 * number of hash functions k(). The array is obtained from an allocator of
 * unsigned char and aligned by hand, as std::allocator does not honor
 * extended alignments before C++17.
 *
 * Moved-from cores have zero blocks and point to a static dummy block with
 * all bits set, so that reads need no special casing; writers check
 * ar.data for null instead.
 */

template<typename Allocator>
class filter_core:boost::empty_value<Allocator,0>
{
  static_assert(
    std::is_same<
      typename boost::allocator_value_type<Allocator>::type,
      unsigned char>::value,
    "Allocator value_type must be unsigned char");

  static constexpr std::size_t alignment=alignof(block);

public:
  using allocator_type=Allocator;
  using size_type=std::size_t;
  using difference_type=std::ptrdiff_t;

  filter_core(
    std::size_t num_blocks_,std::size_t k_,const allocator_type& al_):
    allocator_base{boost::empty_init_t{},al_},
    nb{num_blocks_},
    kh{k_},
    ar(new_array(al(),nb))
  {
    clear_bytes();
  }

  filter_core(const filter_core& x):
    filter_core{
      x,
      boost::allocator_select_on_container_copy_construction(x.al())}{}

  filter_core(filter_core&& x)noexcept:
    filter_core{std::move(x),allocator_type(std::move(x.al()))}{}

  filter_core(const filter_core& x,const allocator_type& al_):
    allocator_base{boost::empty_init_t{},al_},
    nb{x.nb},
    kh{x.kh},
    ar(new_array(al(),x.nb))
  {
    copy_bytes(x);
  }

  filter_core(filter_core&& x,const allocator_type& al_):
    allocator_base{boost::empty_init_t{},al_},
    nb{x.nb},
    kh{x.kh}
  {
    auto empty_ar=new_array(x.al(),0); /* we're relying on this not throwing */
    if(al()==x.al()){
      ar=x.ar;
    }
    else{
      ar=new_array(al(),x.nb);
      copy_bytes(x);
      x.delete_array();
    }
    x.nb=0;
    x.ar=empty_ar;
  }

  ~filter_core()noexcept
  {
    delete_array();
  }

  filter_core& operator=(const filter_core& x)
  {
    static constexpr bool pocca=
      boost::allocator_propagate_on_container_copy_assignment<
        allocator_type>::type::value;

    if(this!=&x){
      if_constexpr<pocca>([&,this]{
        if(al()!=x.al()||nb!=x.nb){
          auto x_al=x.al();
          auto new_ar=new_array(x_al,x.nb);
          delete_array();
          nb=x.nb;
          ar=new_ar;
        }
        copy_assign_if<pocca>(al(),x.al());
      },
      [&,this]{ /* else */
        if(nb!=x.nb){
          auto new_ar=new_array(al(),x.nb);
          delete_array();
          nb=x.nb;
          ar=new_ar;
        }
      });
      kh=x.kh;
      copy_bytes(x);
    }
    return *this;
  }

#if defined(BOOST_MSVC)
#pragma warning(push)
#pragma warning(disable:4127) /* conditional expression is constant */
#endif

  filter_core& operator=(filter_core&& x)noexcept(
    boost::allocator_propagate_on_container_move_assignment<
      allocator_type>::type::value||
    boost::allocator_is_always_equal<allocator_type>::type::value)
  {
    static constexpr bool pocma=
      boost::allocator_propagate_on_container_move_assignment<
        allocator_type>::type::value;

    if(this!=&x){
      auto empty_ar=new_array(x.al(),0); /* relying on this not throwing */
      if(pocma||al()==x.al()){
        delete_array();
        move_assign_if<pocma>(al(),x.al());
        nb=x.nb;
        ar=x.ar;
      }
      else{
        if(nb!=x.nb){
          auto new_ar=new_array(al(),x.nb);
          delete_array();
          nb=x.nb;
          ar=new_ar;
        }
        copy_bytes(x);
        x.delete_array();
      }
      kh=x.kh;
      x.nb=0;
      x.ar=empty_ar;
    }
    return *this;
  }

#if defined(BOOST_MSVC)
#pragma warning(pop) /* C4127 */
#endif

  allocator_type get_allocator()const noexcept
  {
    return al();
  }

  std::size_t num_blocks()const noexcept{return nb;}
  std::size_t k()const noexcept{return kh;}

  void swap(filter_core& x)noexcept(
    boost::allocator_propagate_on_container_swap<
      allocator_type>::type::value||
    boost::allocator_is_always_equal<allocator_type>::type::value)
  {
    static constexpr bool pocs=
      boost::allocator_propagate_on_container_swap<
        allocator_type>::type::value;

    if_constexpr<pocs>([&,this]{
      swap_if<pocs>(al(),x.al());
    },
    [&,this]{ /* else */
      BOOST_ASSERT(al()==x.al());
      (void)this; /* makes sure captured this is used */
    });
    std::swap(nb,x.nb);
    std::swap(kh,x.kh);
    std::swap(ar,x.ar);
  }

  friend bool operator==(const filter_core& x,const filter_core& y)
  {
    if(x.nb!=y.nb||x.kh!=y.kh)return false;
    else if(!x.ar.data)return true;
    else return std::memcmp(x.ar.blocks,y.ar.blocks,x.used_array_size())==0;
  }

protected:
  block*       blocks()noexcept{return ar.blocks;}
  const block* blocks()const noexcept{return ar.blocks;}
  bool         writable()const noexcept{return ar.data!=nullptr;}

  /* Gives *this the shape (num_blocks_,k_), reallocating only if the number
   * of blocks changes. Contents are zeroed.
   */

  void reset(std::size_t num_blocks_,std::size_t k_)
  {
    if(num_blocks_!=nb||!ar.data){
      auto new_ar=new_array(al(),num_blocks_);
      delete_array();
      nb=num_blocks_;
      ar=new_ar;
    }
    kh=k_;
    clear_bytes();
  }

  void clear_bytes()noexcept
  {
    if(ar.data)std::memset(ar.blocks,0,used_array_size());
  }

  void fill_bytes()noexcept
  {
    if(ar.data)std::memset(ar.blocks,0xFF,used_array_size());
  }

  std::size_t used_array_size()const noexcept
  {
    return nb*sizeof(block);
  }

private:
  using allocator_base=boost::empty_value<Allocator,0>;

  const Allocator& al()const{return allocator_base::get();}
  Allocator& al(){return allocator_base::get();}

  static filter_array new_array(allocator_type& al,std::size_t n)
  {
    if(n){
      auto p=boost::allocator_allocate(al,space_for(n));
      return {p,blocks_for(p)};
    }
    else{
      /* dummy block with all bits set to one, see above */

      static struct{unsigned char x=0xFF;} dummy[space_for(1)];

      return {nullptr,blocks_for(reinterpret_cast<unsigned char*>(&dummy))};
    }
  }

  void delete_array()noexcept
  {
    if(ar.data)boost::allocator_deallocate(al(),ar.data,space_for(nb));
  }

  void copy_bytes(const filter_core& x)
  {
    BOOST_ASSERT(nb==x.nb);
    if(ar.data)std::memcpy(ar.blocks,x.ar.blocks,used_array_size());
  }

  static constexpr std::size_t space_for(std::size_t n)noexcept
  {
    return (alignment-1)+n*sizeof(block);
  }

  static block* blocks_for(unsigned char* p)noexcept
  {
    return reinterpret_cast<block*>(p+
      (boost::uintptr_t(alignment)-boost::uintptr_t(p))%alignment);
  }

  std::size_t  nb;
  std::size_t  kh;
  filter_array ar;
};

} /* namespace detail */
} /* namespace blockbloom */
#endif
