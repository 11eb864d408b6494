#include "system_program.hpp"
#include "invoke_ctx.hpp"
#include "tx.hpp"

using namespace lp;

const pub_key& system_program::get_id() const
{
  return tx::get_system_id();
}

str system_program::get_name() const
{
  return "system";
}

err_code system_program::process(
    invoke_ctx& ctx, const uint8_t *data, size_t len )
{
  bindec rdr( (const char*)data, len );
  uint32_t cmd;
  if ( !rdr.get( cmd ) ) {
    return e_invalid_instruction;
  }
  switch( cmd ) {
    case tx::e_create_account: {
      uint64_t lamports, space;
      pub_key owner;
      if ( !rdr.get( lamports ) || !rdr.get( space ) ||
           !rdr.get( owner ) || rdr.get_left() ||
           ctx.get_num_accounts() != 2 ) {
        return e_invalid_instruction;
      }
      return ctx.create_account( ctx.get_account( 0 ),
                                 ctx.get_account( 1 ),
                                 lamports, space, owner, nullptr );
    }
    case tx::e_transfer: {
      uint64_t lamports;
      if ( !rdr.get( lamports ) || rdr.get_left() ||
           ctx.get_num_accounts() != 2 ) {
        return e_invalid_instruction;
      }
      return ctx.transfer( ctx.get_account( 0 ),
                           ctx.get_account( 1 ),
                           lamports, nullptr );
    }
    default: {
      return e_invalid_instruction;
    }
  }
}
