#include "digest.hpp"
#include "key_pair.hpp"
#include <openssl/evp.h>

using namespace lp;

sha256::sha256()
: ctx_( EVP_MD_CTX_new() )
{
  init();
}

sha256::~sha256()
{
  EVP_MD_CTX_free( (EVP_MD_CTX*)ctx_ );
}

void sha256::init()
{
  EVP_DigestInit_ex( (EVP_MD_CTX*)ctx_, EVP_sha256(), NULL );
}

void sha256::add( const uint8_t *buf, size_t len )
{
  EVP_DigestUpdate( (EVP_MD_CTX*)ctx_, buf, len );
}

void sha256::add( str buf )
{
  add( (const uint8_t*)buf.str_, buf.len_ );
}

void sha256::fin( uint8_t *res )
{
  unsigned rlen = len;
  EVP_DigestFinal_ex( (EVP_MD_CTX*)ctx_, res, &rlen );
  init();
}

void sha256::fin( hash& res )
{
  uint8_t buf[len];
  fin( buf );
  res.init_from_buf( buf );
}

void sha256::digest( const uint8_t *buf, size_t len, uint8_t *res )
{
  sha256 sh;
  sh.add( buf, len );
  sh.fin( res );
}
