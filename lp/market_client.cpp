#include "market_client.hpp"

using namespace lp;

market_client::market_client( bank& bk )
: bk_( bk )
{
}

err_code market_client::send( const instruction_vec_t& insv,
                              const signer_vec_t& sigv )
{
  char buf[tx::max_len];
  bincode wtr( buf, sizeof( buf ) );
  if ( !tx::build( wtr, bk_.get_recent_hash(), insv, sigv ) ) {
    return e_invalid_transaction;
  }
  return bk_.process( buf, wtr.size() );
}

err_code market_client::send( const instruction& ins, const key_pair& kp )
{
  instruction_vec_t insv( 1, ins );
  signer_vec_t sigv( 1, &kp );
  return send( insv, sigv );
}

err_code market_client::transfer( const key_pair& from,
                                  const pub_key& to,
                                  uint64_t lamports )
{
  instruction ins;
  tx::transfer( ins, pub_key( from ), to, lamports );
  return send( ins, from );
}

err_code market_client::register_user( const key_pair& kp,
                                       str name,
                                       user_role role )
{
  instruction ins;
  if ( !market_tx::register_user( ins, pub_key( kp ), name, role ) ) {
    return e_invalid_transaction;
  }
  return send( ins, kp );
}

err_code market_client::post_job( const key_pair& kp,
                                  str title,
                                  str description,
                                  uint64_t amount,
                                  const opt_ts& start_date,
                                  const opt_ts& end_date,
                                  pub_key& job )
{
  pub_key client( kp );
  instruction ins;
  if ( !find_job_address( client, title, job ) ||
       !market_tx::initialize_job_post(
         ins, client, title, description, amount, start_date, end_date ) ) {
    return e_invalid_transaction;
  }
  return send( ins, kp );
}

err_code market_client::apply_to_job( const key_pair& kp,
                                      const pub_key& job,
                                      str resume_link,
                                      const opt_ts& expected_end_date,
                                      pub_key& app )
{
  pub_key applicant( kp );
  instruction ins;
  if ( !find_application_address( job, applicant, app ) ||
       !market_tx::apply_to_job(
         ins, applicant, job, resume_link, expected_end_date ) ) {
    return e_invalid_transaction;
  }
  return send( ins, kp );
}

err_code market_client::approve_application( const key_pair& kp,
                                             const pub_key& job,
                                             const pub_key& app )
{
  instruction ins;
  if ( !market_tx::approve_application( ins, pub_key( kp ), job, app ) ) {
    return e_invalid_transaction;
  }
  return send( ins, kp );
}

err_code market_client::submit_work( const key_pair& kp,
                                     const pub_key& app,
                                     str submission_link,
                                     str narration )
{
  application rec;
  if ( !get_application( app, rec ) ) {
    return e_invalid_account_data;
  }
  instruction ins;
  if ( !market_tx::submit_work( ins, pub_key( kp ), rec.job_post_, app,
                                submission_link, narration ) ) {
    return e_invalid_transaction;
  }
  return send( ins, kp );
}

err_code market_client::approve_submission( const key_pair& kp,
                                            const pub_key& job,
                                            const pub_key& app,
                                            str client_review )
{
  application rec;
  if ( !get_application( app, rec ) ) {
    return e_invalid_account_data;
  }
  instruction ins;
  if ( !market_tx::approve_submission( ins, pub_key( kp ), job, app,
                                       rec.applicant_, client_review ) ) {
    return e_invalid_transaction;
  }
  return send( ins, kp );
}

template<class T>
bool market_client::get_record( const pub_key& key, T& rec ) const
{
  account acc;
  return bk_.get_account_db().get( key, acc ) &&
    acc.owner_ == get_market_program_id() &&
    rec.decode( acc.data_ );
}

bool market_client::get_user( const pub_key& wallet,
                              user_account& rec ) const
{
  pub_key addr;
  return find_user_address( wallet, addr ) && get_record( addr, rec );
}

bool market_client::get_job( const pub_key& job, job_post& rec ) const
{
  return get_record( job, rec );
}

bool market_client::get_application( const pub_key& app,
                                     application& rec ) const
{
  return get_record( app, rec );
}

uint64_t market_client::get_balance( const pub_key& key ) const
{
  return bk_.get_account_db().get_lamports( key );
}

uint64_t market_client::get_escrow_balance( const pub_key& job ) const
{
  pub_key esc;
  if ( !find_escrow_address( job, esc ) ) {
    return 0UL;
  }
  return get_balance( esc );
}

void market_client::list_jobs( key_job_vec_t& res ) const
{
  key_account_vec_t accv;
  bk_.get_account_db().get_program_accounts( get_market_program_id(), accv );
  res.clear();
  for( const key_account_t& ka: accv ) {
    job_post job;
    if ( job.decode( ka.second.data_ ) ) {
      res.push_back( key_job_t( ka.first, job ) );
    }
  }
}

void market_client::list_applications( const pub_key& job,
                                       key_app_vec_t& res ) const
{
  key_account_vec_t accv;
  bk_.get_account_db().get_program_accounts( get_market_program_id(), accv );
  res.clear();
  for( const key_account_t& ka: accv ) {
    application app;
    if ( app.decode( ka.second.data_ ) && app.job_post_ == job ) {
      res.push_back( key_app_t( ka.first, app ) );
    }
  }
}
