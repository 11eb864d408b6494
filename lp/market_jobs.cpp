#include "market.hpp"
#include "log.hpp"

using namespace lp;

// dates are given together or not at all, start not before now
static err_code check_dates( const opt_ts& start, const opt_ts& end,
                             int64_t now )
{
  if ( start.has_val_ != end.has_val_ ) {
    return e_invalid_dates;
  }
  if ( start.has_val_ && ( start.val_ > end.val_ || start.val_ < now ) ) {
    return e_invalid_dates;
  }
  return e_success;
}

// accounts: job_post(w), escrow(w), signer(w,s), user
err_code market_program::initialize_job_post( invoke_ctx& ctx, bindec& rdr )
{
  job_post job;
  if ( ctx.get_num_accounts() != 4 ||
       !rdr.get_str( job.title_ ) ||
       !rdr.get_str( job.description_ ) ||
       !rdr.get( job.amount_ ) ||
       !rdr.get_opt( job.start_date_.has_val_, job.start_date_.val_ ) ||
       !rdr.get_opt( job.end_date_.has_val_, job.end_date_.val_ ) ||
       rdr.get_left() ) {
    return e_invalid_instruction;
  }
  acc_info& jacc = ctx.get_account( 0 );
  acc_info& esc = ctx.get_account( 1 );
  acc_info& signer = ctx.get_account( 2 );
  acc_info& user = ctx.get_account( 3 );

  // only clients post jobs
  auth_guard guard( ctx );
  user_account client;
  err_code rc = guard.load_identity( signer, user, client );
  if ( rc == e_success ) {
    rc = guard.require_role( client, e_client );
  }
  if ( rc != e_success ) {
    return rc;
  }
  if ( job.title_.length() > max_title_len ||
       job.description_.length() > max_description_len ) {
    return e_field_too_long;
  }
  if ( job.amount_ == 0 ) {
    return e_invalid_amount;
  }
  rc = check_dates( job.start_date_, job.end_date_,
                    ctx.get_unix_timestamp() );
  if ( rc != e_success ) {
    return rc;
  }

  // escrow derived from the job post address
  pub_key esc_addr;
  rc = escrow::derive(
      ctx.get_program_id(), jacc.key_, esc_addr, job.escrow_bump_ );
  if ( rc != e_success ) {
    return rc;
  }
  if ( esc_addr != esc.key_ ) {
    return e_account_mismatch;
  }

  // allocate job post at ["job_post", client, sha256(title)]
  pda_seeds seeds;
  pub_key addr;
  seeds.init_job_post( signer.key_, job.title_ );
  if ( !seeds.find( ctx.get_program_id(), addr ) ) {
    return e_invalid_seeds;
  }
  rc = ctx.create_account( signer, jacc, 0, job_post::space,
                           ctx.get_program_id(), &seeds.get_seeds() );
  if ( rc != e_success ) {
    return rc;
  }

  // fund escrow
  job.client_ = signer.key_;
  job.is_filled_ = false;
  rc = escrow::deposit( ctx, jacc.key_, signer, esc, job );
  if ( rc != e_success ) {
    return rc;
  }
  rc = store( jacc, job );
  if ( rc != e_success ) {
    return rc;
  }
  LP_LOG_DBG( "job posted" )
    .add( "job", jacc.key_ )
    .add( "client", job.client_ )
    .add( "title", job.title_ )
    .add( "amount", job.amount_ )
    .add( "escrow", esc.key_ )
    .end();
  return e_success;
}
