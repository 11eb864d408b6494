#pragma once

#include <lp/misc.hpp>
#include <stdint.h>
#include <stddef.h>

namespace lp
{

  class hash;

  // incremental sha256 digest
  class sha256
  {
  public:
    static const size_t len = 32;

    sha256();
    ~sha256();

    void init();
    void add( const uint8_t *buf, size_t len );
    void add( str );
    void fin( uint8_t *res );
    void fin( hash& res );

    // one-shot digest
    static void digest( const uint8_t *buf, size_t len, uint8_t *res );

  private:
    sha256( const sha256& );
    sha256& operator=( const sha256& );
    void *ctx_;
  };

}
