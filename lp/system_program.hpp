#pragma once

#include <lp/program.hpp>

namespace lp
{

  // built-in program owning all wallets
  // supports create_account and transfer
  class system_program : public program
  {
  public:
    const pub_key& get_id() const override;
    str get_name() const override;
    err_code process( invoke_ctx&, const uint8_t *, size_t ) override;
  };

}
