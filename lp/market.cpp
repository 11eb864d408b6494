#include "market.hpp"
#include "log.hpp"

using namespace lp;

namespace
{
  struct instr_table
  {
    instr_table() {
      for( unsigned i=0; i != e_num_market_instr; ++i ) {
        get_instr_disc( (market_instr)i, disc_[i] );
      }
    }
    uint8_t disc_[e_num_market_instr][disc_len];
  };
}

const pub_key& market_program::get_id() const
{
  return get_market_program_id();
}

str market_program::get_name() const
{
  return "market";
}

err_code market_program::process(
    invoke_ctx& ctx, const uint8_t *data, size_t len )
{
  static const instr_table itab;
  bindec rdr( (const char*)data, len );
  const char *disc;
  if ( !rdr.get_ref( disc, disc_len ) ) {
    return e_invalid_instruction;
  }
  unsigned ins = 0;
  for( ; ins != e_num_market_instr; ++ins ) {
    if ( 0 == __builtin_memcmp( disc, itab.disc_[ins], disc_len ) ) {
      break;
    }
  }
  switch( ins ) {
    case e_register_user: return register_user( ctx, rdr );
    case e_initialize_job_post: return initialize_job_post( ctx, rdr );
    case e_apply_to_job: return apply_to_job( ctx, rdr );
    case e_approve_application: return approve_application( ctx, rdr );
    case e_submit_work: return submit_work( ctx, rdr );
    case e_approve_submission: return approve_submission( ctx, rdr );
    default: return e_invalid_instruction;
  }
}

// accounts: user(w), signer(w,s)
err_code market_program::register_user( invoke_ctx& ctx, bindec& rdr )
{
  std::string name;
  uint8_t role;
  if ( ctx.get_num_accounts() != 2 ||
       !rdr.get_str( name ) ||
       !rdr.get( role ) || role > (uint8_t)e_freelancer ||
       rdr.get_left() ) {
    return e_invalid_instruction;
  }
  acc_info& user = ctx.get_account( 0 );
  acc_info& signer = ctx.get_account( 1 );
  auth_guard guard( ctx );
  err_code rc = guard.check_signer( signer );
  if ( rc != e_success ) {
    return rc;
  }
  if ( name.length() > max_name_len ) {
    return e_field_too_long;
  }

  // allocate identity record at ["user", wallet]
  pda_seeds seeds;
  pub_key addr;
  seeds.init_user( signer.key_ );
  if ( !seeds.find( ctx.get_program_id(), addr ) ) {
    return e_invalid_seeds;
  }
  rc = ctx.create_account( signer, user, 0, user_account::space,
                           ctx.get_program_id(), &seeds.get_seeds() );
  if ( rc != e_success ) {
    return rc;
  }
  user_account rec;
  rec.wallet_ = signer.key_;
  rec.name_ = name;
  rec.role_ = (user_role)role;
  rc = store( user, rec );
  if ( rc != e_success ) {
    return rc;
  }
  LP_LOG_DBG( "user registered" )
    .add( "wallet", rec.wallet_ )
    .add( "name", rec.name_ )
    .add( "role", user_role_to_str( rec.role_ ) )
    .end();
  return e_success;
}
