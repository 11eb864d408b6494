#pragma once

#include <lp/key_pair.hpp>
#include <lp/error.hpp>

namespace lp
{

  class invoke_ctx;

  // on-ledger program executed by the bank
  class program
  {
  public:
    virtual ~program();

    // program id accounts are owned by
    virtual const pub_key& get_id() const = 0;

    // program name for logging
    virtual str get_name() const = 0;

    // execute one instruction against the context's accounts
    virtual err_code process( invoke_ctx&,
                              const uint8_t *data,
                              size_t len ) = 0;
  };

}
