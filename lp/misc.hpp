#pragma once

#include <stdint.h>
#include <string>

#define LP_UNLIKELY(ARG) __builtin_expect((ARG),0)
#define LP_NSECS_IN_SEC  1000000000L

namespace lp
{

  // base58 encoding (bitcoin alphabet) used for keys and signatures
  // returns encoded length or -1 if result buffer too small
  int enc_base58( const uint8_t *src, int len, char *result, int rlen );

  // returns decoded length or -1 on invalid input or overflow
  int dec_base58( const char *src, int len, uint8_t *result, int rlen );

  // integer to string encoding
  char *uint_to_str( uint64_t val, char *end_ptr );
  char *int_to_str( int64_t val, char *end_ptr );

  // strict parsing of decimal text
  bool str_to_uint( const char *str, size_t len, uint64_t& );
  bool str_to_int( const char *str, size_t len, int64_t& );

  // lower-case hex encoding
  std::string enc_hex( const uint8_t *src, size_t len );

  // current time
  int64_t get_now();
  char *nsecs_to_utc6( int64_t ts, char *cptr );

  // string as char pointer plus length
  struct str
  {
    str();
    str( const char * );
    str( const char *, size_t );
    str( const uint8_t *, size_t );
    str( const std::string& );
    bool operator==( const str& ) const;
    bool operator!=( const str& ) const;
    std::string as_string() const;
    const char *str_;
    size_t      len_;
  };

  /////////////////////////////////////////////////////////////////////////
  // inline impl

  inline str::str()
  : str_( "" ), len_( 0 ) {
  }

  inline str::str( const char *str )
  : str_( str ), len_( __builtin_strlen( str ) ) {
  }

  inline str::str( const char *str, size_t len )
  : str_( str ), len_( len ) {
  }

  inline str::str( const uint8_t *str, size_t len )
  : str_( (const char*)str ), len_( len ) {
  }

  inline str::str( const std::string& str )
  : str_( str.c_str() ), len_( str.length() ) {
  }

  inline bool str::operator==( const str& obj ) const
  {
    return len_ == obj.len_ &&
           0 == __builtin_memcmp( str_, obj.str_, len_);
  }

  inline bool str::operator!=( const str& obj ) const
  {
    return !(*this == obj );
  }

  inline std::string str::as_string() const
  {
    return std::string( str_, len_ );
  }

}
