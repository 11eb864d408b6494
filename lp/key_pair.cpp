#include "key_pair.hpp"
#include "digest.hpp"
#include "jtree.hpp"
#include <openssl/evp.h>
#include <openssl/bn.h>
#include <unistd.h>
#include <fcntl.h>

using namespace lp;

hash::hash()
{
  zero();
}

hash::hash( const hash& obj )
{
  *this = obj;
}

hash& hash::operator=( const hash& obj )
{
  i_[0] = obj.i_[0];
  i_[1] = obj.i_[1];
  i_[2] = obj.i_[2];
  i_[3] = obj.i_[3];
  return *this;
}

bool hash::operator==( const hash& obj) const
{
  return i_[0] == obj.i_[0] &&
    i_[1] == obj.i_[1] &&
    i_[2] == obj.i_[2] &&
    i_[3] == obj.i_[3];
}

bool hash::operator!=( const hash& obj) const
{
  return !(*this == obj);
}

bool hash::operator<( const hash& obj ) const
{
  return __builtin_memcmp( pk_, obj.pk_, len ) < 0;
}

void hash::zero()
{
  i_[0] = i_[1] = i_[2] = i_[3] = 0UL;
}

bool hash::is_zero() const
{
  return 0UL == ( i_[0] | i_[1] | i_[2] | i_[3] );
}

bool hash::init_from_text( str buf )
{
  uint8_t res[2*len];
  int n = lp::dec_base58( buf.str_, (int)buf.len_, res, (int)sizeof( res ) );
  if ( n != (int)len ) {
    zero();
    return false;
  }
  init_from_buf( res );
  return true;
}

void hash::init_from_buf( const uint8_t *pk )
{
  __builtin_memcpy( pk_, pk, len );
}

int hash::enc_base58( char *buf, int buflen ) const
{
  return lp::enc_base58( pk_, len, buf, buflen );
}

int hash::enc_base58( std::string& res ) const
{
  char buf[64];
  int n = enc_base58( buf, sizeof( buf ) );
  res.assign( buf, n > 0 ? (size_t)n : 0 );
  return n;
}

std::string hash::as_string() const
{
  std::string res;
  enc_base58( res );
  return res;
}

pub_key::pub_key()
{
}

pub_key::pub_key( const pub_key& obj )
: hash( obj )
{
}

pub_key::pub_key( const key_pair& kp )
{
  kp.get_pub_key( *this );
}

pub_key& pub_key::operator=( const pub_key& pk )
{
  hash::operator=( pk );
  return *this;
}

// ed25519 point decompression test: with p = 2^255-19 and
// d = -121665/121666, y decodes to a point iff (y^2-1)/(d*y^2+1)
// is zero or a quadratic residue mod p
bool pub_key::is_on_curve() const
{
  BN_CTX *ctx = BN_CTX_new();
  if ( !ctx ) {
    return true;
  }
  BN_CTX_start( ctx );
  BIGNUM *p = BN_CTX_get( ctx );
  BIGNUM *d = BN_CTX_get( ctx );
  BIGNUM *t = BN_CTX_get( ctx );
  BIGNUM *y = BN_CTX_get( ctx );
  BIGNUM *u = BN_CTX_get( ctx );
  BIGNUM *v = BN_CTX_get( ctx );
  BIGNUM *one = BN_CTX_get( ctx );
  bool res = true;
  if ( one ) {
    BN_zero( p );
    BN_set_bit( p, 255 );
    BN_sub_word( p, 19 );
    BN_one( one );

    BN_set_word( t, 121666 );
    BN_mod_inverse( d, t, p, ctx );
    BN_set_word( t, 121665 );
    BN_mod_mul( d, d, t, p, ctx );
    BN_sub( d, p, d );

    // little-endian y with sign bit cleared
    uint8_t be[len];
    for( unsigned i=0; i != len; ++i ) {
      be[i] = pk_[len-1-i];
    }
    be[0] &= 0x7f;
    BN_bin2bn( be, len, u );
    BN_nnmod( y, u, p, ctx );

    BN_mod_sqr( t, y, p, ctx );
    BN_mod_sub( u, t, one, p, ctx );
    BN_mod_mul( v, t, d, p, ctx );
    BN_mod_add( v, v, one, p, ctx );
    BN_mod_inverse( d, v, p, ctx );
    BN_mod_mul( u, u, d, p, ctx );
    if ( BN_is_zero( u ) ) {
      res = true;
    } else {
      // euler criterion
      BN_sub( t, p, one );
      BN_rshift1( t, t );
      BN_mod_exp( v, u, t, p, ctx );
      res = BN_is_one( v );
    }
  }
  BN_CTX_end( ctx );
  BN_CTX_free( ctx );
  return res;
}

bool pub_key::create_program_address(
    const seed_vec_t& seeds, const pub_key& prog )
{
  static const char pda_marker[] = "ProgramDerivedAddress";
  if ( seeds.size() > max_seeds ) {
    return false;
  }
  sha256 sh;
  for( const str& seed: seeds ) {
    if ( seed.len_ > max_seed_len ) {
      return false;
    }
    sh.add( seed );
  }
  sh.add( prog.data(), len );
  sh.add( str( pda_marker ) );
  sh.fin( *this );
  return !is_on_curve();
}

bool pub_key::find_program_address(
    const seed_vec_t& seeds, const pub_key& prog, uint8_t& bump )
{
  if ( seeds.size() >= max_seeds ) {
    return false;
  }
  seed_vec_t bseeds( seeds );
  uint8_t bump_seed[1];
  bseeds.push_back( str( bump_seed, 1 ) );
  for( unsigned i = 256; i-- != 0; ) {
    bump_seed[0] = (uint8_t)i;
    if ( create_program_address( bseeds, prog ) ) {
      bump = bump_seed[0];
      return true;
    }
  }
  zero();
  return false;
}

bool key_pair::gen()
{
  EVP_PKEY *pkey = NULL;
  EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id( EVP_PKEY_ED25519, NULL );
  if ( !pctx ) {
    return false;
  }
  int rc = EVP_PKEY_keygen_init( pctx );
  if ( rc > 0 ) {
    rc = EVP_PKEY_keygen( pctx, &pkey );
  }
  EVP_PKEY_CTX_free( pctx );
  if ( rc <= 0 || !pkey ) {
    return false;
  }
  size_t slen[] = { pub_key::len };
  size_t plen[] = { pub_key::len };
  rc = EVP_PKEY_get_raw_private_key( pkey, pk_, slen );
  if ( rc > 0 ) {
    rc = EVP_PKEY_get_raw_public_key( pkey, &pk_[pub_key::len], plen );
  }
  EVP_PKEY_free( pkey );
  return rc > 0;
}

void key_pair::zero()
{
  __builtin_memset( pk_, 0, len );
}

// json array of 64 byte values with room for whitespace
static const size_t max_key_file_len = 1024;

bool key_pair::init_from_file( const std::string& file )
{
  int fd = ::open( file.c_str(), O_RDONLY );
  if ( fd < 0 ) {
    return false;
  }
  char buf[max_key_file_len];
  size_t len = 0;
  ssize_t num = 0;
  while( len < sizeof( buf ) &&
         ( num = ::read( fd, &buf[len], sizeof( buf ) - len ) ) > 0 ) {
    len += (size_t)num;
  }
  ::close( fd );
  if ( num < 0 || len == 0 || len == sizeof( buf ) ) {
    return false;
  }
  return init_from_json( buf, len );
}

bool key_pair::init_from_json( const std::string& buf )
{
  return init_from_json( buf.c_str(), buf.length() );
}

bool key_pair::init_from_json( const char *buf, size_t blen )
{
  jtree jt;
  jt.parse( buf, blen );
  if ( !jt.is_valid() || jt.get_type( 1 ) != jtree::e_arr ) {
    return false;
  }
  size_t num = 0;
  for( uint32_t it = jt.get_first(1); it; it = jt.get_next( it ) ) {
    uint64_t val = 0;
    if ( num == len || !jt.get_uint( it, val ) || val > 255UL ) {
      return false;
    }
    pk_[num++] = (uint8_t)val;
  }
  return num == len;
}

void key_pair::enc_json( std::string& res ) const
{
  char buf[8], *end = &buf[sizeof(buf)];
  res = '[';
  for( unsigned i=0; i != len; ++i ) {
    if ( i ) {
      res += ',';
    }
    char *cptr = uint_to_str( pk_[i], end );
    res.append( cptr, end - cptr );
  }
  res += ']';
}

void key_pair::get_pub_key( pub_key& pk ) const
{
  pk.init_from_buf( &pk_[pub_key::len] );
}

bool signature::operator==( const signature& obj ) const
{
  return 0 == __builtin_memcmp( sig_, obj.sig_, len );
}

void signature::init_from_buf( const uint8_t *buf )
{
  __builtin_memcpy( sig_, buf, len );
}

bool signature::init_from_text( str buf )
{
  uint8_t res[2*len];
  int n = lp::dec_base58( buf.str_, (int)buf.len_, res, (int)sizeof( res ) );
  if ( n != (int)len ) {
    return false;
  }
  init_from_buf( res );
  return true;
}

int signature::enc_base58( char *buf, int buflen ) const
{
  return lp::enc_base58( sig_, len, buf, buflen );
}

int signature::enc_base58( std::string& res ) const
{
  char buf[128];
  int n = enc_base58( buf, sizeof( buf ) );
  res.assign( buf, n > 0 ? (size_t)n : 0 );
  return n;
}

bool signature::sign(
    const uint8_t* msg, size_t msg_len, const key_pair& kp )
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key( EVP_PKEY_ED25519,
      NULL, kp.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestSignInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc > 0 ) {
    size_t sig_len[1] = { len };
    rc = EVP_DigestSign( mctx, sig_, sig_len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc > 0;
}

bool signature::verify(
    const uint8_t* msg, size_t msg_len, const pub_key& pk ) const
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key( EVP_PKEY_ED25519,
      NULL, pk.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestVerifyInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc > 0 ) {
    rc = EVP_DigestVerify( mctx, sig_, len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc == 1;
}
