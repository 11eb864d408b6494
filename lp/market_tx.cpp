#include "market_tx.hpp"

using namespace lp;

static const size_t max_data_len = tx::max_len;

static void init_instr( instruction& ins, market_instr mi,
                        bincode& wtr, char *buf )
{
  uint8_t disc[disc_len];
  get_instr_disc( mi, disc );
  ins.prog_ = get_market_program_id();
  ins.accs_.clear();
  ins.data_.clear();
  wtr.attach( buf, max_data_len );
  wtr.add( (const char*)disc, disc_len );
}

static bool fin_instr( instruction& ins, const bincode& wtr )
{
  if ( wtr.get_is_overflow() ) {
    return false;
  }
  ins.set_data( wtr );
  return true;
}

bool market_tx::register_user( instruction& ins,
                               const pub_key& signer,
                               str name,
                               user_role role )
{
  char buf[max_data_len];
  bincode wtr;
  init_instr( ins, e_register_user, wtr, buf );
  wtr.add_str( name );
  wtr.add( (uint8_t)role );
  pub_key user;
  if ( !find_user_address( signer, user ) ) {
    return false;
  }
  ins.add_account( user, false, true );
  ins.add_account( signer, true, true );
  return fin_instr( ins, wtr );
}

bool market_tx::initialize_job_post( instruction& ins,
                                     const pub_key& signer,
                                     str title,
                                     str description,
                                     uint64_t amount,
                                     const opt_ts& start_date,
                                     const opt_ts& end_date )
{
  char buf[max_data_len];
  bincode wtr;
  init_instr( ins, e_initialize_job_post, wtr, buf );
  wtr.add_str( title );
  wtr.add_str( description );
  wtr.add( amount );
  wtr.add_opt( start_date.has_val_, start_date.val_ );
  wtr.add_opt( end_date.has_val_, end_date.val_ );
  pub_key job, esc, user;
  if ( !find_job_address( signer, title, job ) ||
       !find_escrow_address( job, esc ) ||
       !find_user_address( signer, user ) ) {
    return false;
  }
  ins.add_account( job, false, true );
  ins.add_account( esc, false, true );
  ins.add_account( signer, true, true );
  ins.add_account( user, false, false );
  return fin_instr( ins, wtr );
}

bool market_tx::apply_to_job( instruction& ins,
                              const pub_key& signer,
                              const pub_key& job,
                              str resume_link,
                              const opt_ts& expected_end_date )
{
  char buf[max_data_len];
  bincode wtr;
  init_instr( ins, e_apply_to_job, wtr, buf );
  wtr.add_str( resume_link );
  wtr.add_opt( expected_end_date.has_val_, expected_end_date.val_ );
  pub_key app, user;
  if ( !find_application_address( job, signer, app ) ||
       !find_user_address( signer, user ) ) {
    return false;
  }
  ins.add_account( app, false, true );
  ins.add_account( signer, true, true );
  ins.add_account( user, false, false );
  ins.add_account( job, false, false );
  return fin_instr( ins, wtr );
}

bool market_tx::approve_application( instruction& ins,
                                     const pub_key& signer,
                                     const pub_key& job,
                                     const pub_key& app )
{
  char buf[max_data_len];
  bincode wtr;
  init_instr( ins, e_approve_application, wtr, buf );
  pub_key user;
  if ( !find_user_address( signer, user ) ) {
    return false;
  }
  ins.add_account( app, false, true );
  ins.add_account( job, false, true );
  ins.add_account( signer, true, true );
  ins.add_account( user, false, false );
  return fin_instr( ins, wtr );
}

bool market_tx::submit_work( instruction& ins,
                             const pub_key& signer,
                             const pub_key& job,
                             const pub_key& app,
                             str submission_link,
                             str narration )
{
  char buf[max_data_len];
  bincode wtr;
  init_instr( ins, e_submit_work, wtr, buf );
  wtr.add_str( submission_link );
  wtr.add_str( narration );
  pub_key user;
  if ( !find_user_address( signer, user ) ) {
    return false;
  }
  ins.add_account( app, false, true );
  ins.add_account( signer, true, true );
  ins.add_account( user, false, false );
  ins.add_account( job, false, false );
  return fin_instr( ins, wtr );
}

bool market_tx::approve_submission( instruction& ins,
                                    const pub_key& signer,
                                    const pub_key& job,
                                    const pub_key& app,
                                    const pub_key& freelancer,
                                    str client_review )
{
  char buf[max_data_len];
  bincode wtr;
  init_instr( ins, e_approve_submission, wtr, buf );
  wtr.add_str( client_review );
  pub_key esc, user;
  if ( !find_escrow_address( job, esc ) ||
       !find_user_address( signer, user ) ) {
    return false;
  }
  ins.add_account( app, false, true );
  ins.add_account( job, false, true );
  ins.add_account( esc, false, true );
  ins.add_account( signer, true, true );
  ins.add_account( user, false, false );
  ins.add_account( freelancer, false, true );
  return fin_instr( ins, wtr );
}
