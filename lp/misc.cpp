#include "misc.hpp"
#include <ctype.h>
#include <time.h>
#include <vector>

namespace lp
{

static const char b58_alphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int b58_lookup( char c )
{
  const char *p = __builtin_strchr( b58_alphabet, c );
  return ( p && c ) ? (int)(p - b58_alphabet) : -1;
}

int enc_base58( const uint8_t *src, int len, char *result, int rlen )
{
  int zeros = 0;
  while( zeros < len && !src[zeros] ) ++zeros;

  // log(256)/log(58) rounded up
  std::vector<uint8_t> b58( 1 + (len - zeros) * 138 / 100, 0 );
  int size = (int)b58.size(), length = 0;
  for( int i = zeros; i != len; ++i ) {
    uint32_t carry = src[i];
    int j = 0;
    for( int k = size - 1; (carry || j < length) && k >= 0; --k, ++j ) {
      carry += 256 * b58[k];
      b58[k] = carry % 58;
      carry /= 58;
    }
    length = j;
  }
  int it = size - length;
  while( it != size && !b58[it] ) ++it;
  int total = zeros + size - it;
  if ( total + 1 > rlen ) {
    return -1;
  }
  int ri = 0;
  while( ri < zeros ) result[ri++] = '1';
  for( ; it != size; ++it ) result[ri++] = b58_alphabet[b58[it]];
  result[ri] = '\0';
  return ri;
}

int dec_base58( const char *src, int len, uint8_t *result, int rlen )
{
  int zeros = 0;
  while( zeros < len && src[zeros] == '1' ) ++zeros;

  std::vector<uint8_t> b256( 1 + (len - zeros) * 733 / 1000, 0 );
  int size = (int)b256.size(), length = 0;
  for( int i = zeros; i != len; ++i ) {
    int val = b58_lookup( src[i] );
    if ( val < 0 ) {
      return -1;
    }
    uint32_t carry = (uint32_t)val;
    int j = 0;
    for( int k = size - 1; (carry || j < length) && k >= 0; --k, ++j ) {
      carry += 58 * b256[k];
      b256[k] = carry & 0xff;
      carry >>= 8;
    }
    length = j;
  }
  int it = size - length;
  while( it != size && !b256[it] ) ++it;
  int total = zeros + size - it;
  if ( total > rlen ) {
    return -1;
  }
  int ri = 0;
  while( ri < zeros ) result[ri++] = 0;
  for( ; it != size; ++it ) result[ri++] = b256[it];
  return ri;
}

char *uint_to_str( uint64_t val, char *cptr )
{
  if ( val ) {
    while( val ) {
      *--cptr = '0' + (val%10UL);
      val /= 10UL;
    }
  } else {
    *--cptr = '0';
  }
  return cptr;
}

char *int_to_str( int64_t val, char *cptr )
{
  bool is_neg = val < 0;
  uint64_t uval = is_neg ? 0UL - (uint64_t)val : (uint64_t)val;
  cptr = uint_to_str( uval, cptr );
  if ( is_neg ) {
    *--cptr = '-';
  }
  return cptr;
}

bool str_to_uint( const char *val, size_t len, uint64_t& res )
{
  res = 0UL;
  if ( !len || len > 20 ) {
    return false;
  }
  for( const char *cptr = val, *end = &val[len]; cptr != end; ++cptr ) {
    if ( !isdigit( *cptr ) ) {
      return false;
    }
    uint64_t nxt = res*10UL + (uint64_t)(*cptr-'0');
    if ( nxt / 10UL != res ) {
      return false;
    }
    res = nxt;
  }
  return true;
}

bool str_to_int( const char *val, size_t len, int64_t& res )
{
  res = 0L;
  bool is_neg = len && val[0] == '-';
  if ( is_neg ) {
    ++val;
    --len;
  }
  uint64_t uval;
  if ( !str_to_uint( val, len, uval ) ) {
    return false;
  }
  if ( is_neg ) {
    if ( uval > (uint64_t)INT64_MAX + 1UL ) {
      return false;
    }
    res = (int64_t)(0UL - uval);
  } else {
    if ( uval > (uint64_t)INT64_MAX ) {
      return false;
    }
    res = (int64_t)uval;
  }
  return true;
}

std::string enc_hex( const uint8_t *src, size_t len )
{
  static const char digits[] = "0123456789abcdef";
  std::string res;
  res.reserve( 2*len );
  for( size_t i = 0; i != len; ++i ) {
    res += digits[src[i]>>4];
    res += digits[src[i]&0xf];
  }
  return res;
}

int64_t get_now()
{
  struct timespec ts[1];
  clock_gettime( CLOCK_REALTIME, ts );
  int64_t res = ts->tv_sec;
  res *= LP_NSECS_IN_SEC;
  res += ts->tv_nsec;
  return res;
}

static void uint_to_strn( char *cptr, int64_t val, int n )
{
  for( int i = n-1; i >= 0; --i ) {
    cptr[i] = '0' + (val%10L);
    val /= 10L;
  }
}

char *nsecs_to_utc6( int64_t ts, char *cptr )
{
  int64_t nsecs = ts%LP_NSECS_IN_SEC;
  time_t secs = ts/LP_NSECS_IN_SEC;
  struct tm t[1];
  gmtime_r( &secs, t );
  uint_to_strn( &cptr[0], t->tm_year + 1900, 4 );
  uint_to_strn( &cptr[5], t->tm_mon + 1, 2 );
  uint_to_strn( &cptr[8], t->tm_mday, 2 );
  uint_to_strn( &cptr[11], t->tm_hour, 2 );
  uint_to_strn( &cptr[14], t->tm_min, 2 );
  uint_to_strn( &cptr[17], t->tm_sec, 2 );
  uint_to_strn( &cptr[20], nsecs/1000L, 6 );
  cptr[4] = cptr[7] = '-';
  cptr[10] = 'T';
  cptr[13] = cptr[16] = ':';
  cptr[19] = '.';
  cptr[26] = 'Z';
  cptr[27] = '\0';
  return cptr;
}

}
