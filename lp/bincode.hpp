#pragma once

#include <lp/key_pair.hpp>
#include <stdint.h>
#include <string>

namespace lp
{

  // binary serialization in the spirit of rust bincode/borsh
  // conventions: little-endian integers, u32 length-prefixed strings
  // and compact-u16 array lengths in transaction messages
  class bincode
  {
  public:
    bincode();
    bincode( char *buf, size_t cap );

    // attach buffer
    void attach( char *buf, size_t cap );
    char *get_buf() const;
    size_t size() const;

    // writes past capacity are dropped and flagged
    bool get_is_overflow() const;

    // get/modify current write position
    size_t get_pos() const;
    void set_pos( size_t );
    void reset_pos();

    // reserve slot for signature
    size_t reserve_sign();

    // sign message at position sig for message starting at position msg
    bool sign( size_t sig, size_t msg, const key_pair& );

    // add values to buffer
    void add( uint8_t );
    void add( uint32_t );
    void add( uint64_t );
    void add( int64_t );
    void add( const hash& );
    void add( const char *, size_t );
    void add_bool( bool );

    // u32 length-prefixed string
    void add_str( str );

    // u8-tagged optional integer
    void add_opt( bool has_val, int64_t val );

    // add (fixed) array length encoding
    template<unsigned N> void add_len();
    void add_len( unsigned );

  private:
    bool fits( size_t );
    template<class T> void add_val_T( T val );
    char  *buf_;
    size_t idx_;
    size_t cap_;
    bool   ovr_;
  };

  // bounds-checked reader for bincode-formatted buffers
  class bindec
  {
  public:
    bindec( const char *buf, size_t len );

    bool get( uint8_t& );
    bool get( uint32_t& );
    bool get( uint64_t& );
    bool get( int64_t& );
    bool get( hash& );
    bool get_bool( bool& );

    // u32 length-prefixed string
    bool get_str( std::string& );

    // u8-tagged optional integer
    bool get_opt( bool& has_val, int64_t& val );

    // compact-u16 length
    bool get_len( unsigned& );

    // reference to next len bytes
    bool get_ref( const char *&, size_t len );

    size_t get_pos() const;
    size_t get_left() const;

  private:
    template<class T> bool get_val_T( T& val );
    const char *buf_;
    size_t      idx_;
    size_t      len_;
  };

  inline bincode::bincode()
  : buf_( nullptr ), idx_( 0 ), cap_( 0 ), ovr_( false ) {
  }

  inline bincode::bincode( char *buf, size_t cap )
  : buf_( buf ), idx_( 0 ), cap_( cap ), ovr_( false ) {
  }

  inline void bincode::attach( char *buf, size_t cap )
  {
    buf_ = buf;
    idx_ = 0;
    cap_ = cap;
    ovr_ = false;
  }

  inline char *bincode::get_buf() const
  {
    return buf_;
  }

  inline size_t bincode::size() const
  {
    return idx_;
  }

  inline bool bincode::get_is_overflow() const
  {
    return ovr_;
  }

  inline void bincode::reset_pos()
  {
    idx_ = 0;
    ovr_ = false;
  }

  inline size_t bincode::get_pos() const
  {
    return idx_;
  }

  inline void bincode::set_pos( size_t pos )
  {
    idx_ = pos;
  }

  inline bool bincode::fits( size_t len )
  {
    if ( LP_UNLIKELY( ovr_ || len > cap_ - idx_ ) ) {
      ovr_ = true;
      return false;
    }
    return true;
  }

  template<class T>
  void bincode::add_val_T( T val )
  {
    if ( fits( sizeof( T ) ) ) {
      __builtin_memcpy( &buf_[idx_], &val, sizeof( T ) );
      idx_ += sizeof( T );
    }
  }

  inline void bincode::add( uint8_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( uint32_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( uint64_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( int64_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add_bool( bool val )
  {
    add( (uint8_t)( val ? 1 : 0 ) );
  }

  inline void bincode::add( const hash& pk )
  {
    add( (const char*)pk.data(), hash::len );
  }

  inline void bincode::add( const char *buf, size_t len )
  {
    if ( fits( len ) ) {
      __builtin_memcpy( &buf_[idx_], buf, len );
      idx_ += len;
    }
  }

  inline void bincode::add_str( str val )
  {
    add( (uint32_t)val.len_ );
    add( val.str_, val.len_ );
  }

  inline void bincode::add_opt( bool has_val, int64_t val )
  {
    add_bool( has_val );
    if ( has_val ) {
      add( val );
    }
  }

  template<unsigned N> void bincode::add_len()
  {
    static_assert( N < 0x4000, "compact length out of range" );
    add_len( N );
  }

  inline void bincode::add_len( unsigned N )
  {
    if ( N < 0x80 ) {
      add( (uint8_t)(N&0x7f) );
    } else {
      add( (uint8_t)(0x80 | (N&0x7f) ) );
      add( (uint8_t)((N>>7)&0x7f) );
    }
  }

  inline size_t bincode::reserve_sign()
  {
    size_t idx = idx_;
    if ( fits( signature::len ) ) {
      __builtin_memset( &buf_[idx_], 0, signature::len );
      idx_ += signature::len;
    }
    return idx;
  }

  inline bool bincode::sign( size_t sig, size_t msg, const key_pair& kp )
  {
    if ( ovr_ ) {
      return false;
    }
    signature sgn;
    if ( !sgn.sign( (const uint8_t*)&buf_[msg], idx_ - msg, kp ) ) {
      return false;
    }
    __builtin_memcpy( &buf_[sig], sgn.data(), signature::len );
    return true;
  }

  inline bindec::bindec( const char *buf, size_t len )
  : buf_( buf ), idx_( 0 ), len_( len ) {
  }

  template<class T>
  bool bindec::get_val_T( T& val )
  {
    if ( sizeof( T ) > len_ - idx_ ) {
      return false;
    }
    __builtin_memcpy( &val, &buf_[idx_], sizeof( T ) );
    idx_ += sizeof( T );
    return true;
  }

  inline bool bindec::get( uint8_t& val )
  {
    return get_val_T( val );
  }

  inline bool bindec::get( uint32_t& val )
  {
    return get_val_T( val );
  }

  inline bool bindec::get( uint64_t& val )
  {
    return get_val_T( val );
  }

  inline bool bindec::get( int64_t& val )
  {
    return get_val_T( val );
  }

  inline bool bindec::get_bool( bool& val )
  {
    uint8_t ival;
    if ( !get( ival ) || ival > 1 ) {
      return false;
    }
    val = ival != 0;
    return true;
  }

  inline bool bindec::get( hash& val )
  {
    const char *ptr;
    if ( !get_ref( ptr, hash::len ) ) {
      return false;
    }
    val.init_from_buf( (const uint8_t*)ptr );
    return true;
  }

  inline bool bindec::get_str( std::string& val )
  {
    uint32_t len;
    const char *ptr;
    if ( !get( len ) || !get_ref( ptr, len ) ) {
      return false;
    }
    val.assign( ptr, len );
    return true;
  }

  inline bool bindec::get_opt( bool& has_val, int64_t& val )
  {
    val = 0;
    if ( !get_bool( has_val ) ) {
      return false;
    }
    return !has_val || get( val );
  }

  inline bool bindec::get_len( unsigned& val )
  {
    uint8_t b0, b1;
    if ( !get( b0 ) ) {
      return false;
    }
    val = b0 & 0x7f;
    if ( b0 & 0x80 ) {
      if ( !get( b1 ) || ( b1 & 0x80 ) ) {
        return false;
      }
      val |= ((unsigned)b1) << 7;
    }
    return true;
  }

  inline bool bindec::get_ref( const char *&ptr, size_t len )
  {
    if ( len > len_ - idx_ ) {
      return false;
    }
    ptr = &buf_[idx_];
    idx_ += len;
    return true;
  }

  inline size_t bindec::get_pos() const
  {
    return idx_;
  }

  inline size_t bindec::get_left() const
  {
    return len_ - idx_;
  }

}
