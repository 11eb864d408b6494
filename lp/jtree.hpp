#pragma once

#include <lp/misc.hpp>
#include <vector>
#include <stdint.h>

namespace lp
{
  // light-weight json parse tree over an external buffer
  // node 0 is unused, node 1 is the root value
  class jtree
  {
  public:

    typedef enum {
      e_obj = 0,
      e_arr,
      e_keyval,
      e_val
    } type_t;

    jtree();

    // parse message
    void parse( const char *, size_t );
    bool is_valid() const;

    // node navigation
    type_t   get_type( uint32_t ) const;
    uint32_t get_next( uint32_t ) const;
    uint32_t get_first( uint32_t ) const;

    // key/value pair
    uint32_t get_key( uint32_t ) const;
    uint32_t get_val( uint32_t ) const;

    // primitive value
    str  get_str( uint32_t ) const;
    bool get_uint( uint32_t, uint64_t& ) const;
    bool get_int( uint32_t, int64_t& ) const;

    // find value in object associated with key
    uint32_t find_val( uint32_t obj, str key ) const;

  private:

    struct node {
      uint32_t type_:8;
      uint32_t next_:24;
      uint32_t h_;  // head of obj/arr, key of pair or text offset
      uint32_t t_;  // tail of obj/arr, value of pair or text length
    };

    uint32_t new_node( type_t, uint32_t, uint32_t );
    void add( uint32_t );
    void start( type_t );
    void finish();
    void add_text( const char *, const char * );
    void add_key( const char *, const char * );

    typedef std::vector<node>     node_vec_t;
    typedef std::vector<uint32_t> stack_t;
    node_vec_t nv_;
    stack_t    st_;
    uint32_t   key_;
    bool       err_;
    const char*buf_;
  };

  ///////////////////////////////////////////////////////////////////////
  // inline implementation

  inline jtree::type_t jtree::get_type( uint32_t i ) const
  {
    return (type_t)nv_[i].type_;
  }

  inline uint32_t jtree::get_next( uint32_t i ) const
  {
    return nv_[i].next_;
  }

  inline uint32_t jtree::get_first( uint32_t i ) const
  {
    return nv_[i].h_;
  }

  inline uint32_t jtree::get_key( uint32_t i ) const
  {
    return nv_[i].h_;
  }

  inline uint32_t jtree::get_val( uint32_t i ) const
  {
    return nv_[i].t_;
  }

  inline str jtree::get_str( uint32_t i ) const
  {
    const node& n = nv_[i];
    return str( &buf_[n.h_], n.t_ );
  }

  inline bool jtree::get_uint( uint32_t i, uint64_t& val ) const
  {
    const node& n = nv_[i];
    return str_to_uint( &buf_[n.h_], n.t_, val );
  }

  inline bool jtree::get_int( uint32_t i, int64_t& val ) const
  {
    const node& n = nv_[i];
    return str_to_int( &buf_[n.h_], n.t_, val );
  }

}
