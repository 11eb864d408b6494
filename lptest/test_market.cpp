#include <lp/market_client.hpp>
#include <lp/market.hpp>
#include <lp/log.hpp>
#include "test_error.hpp"
#include <stdlib.h>
#include <unistd.h>

using namespace lp;

static const int64_t test_now = 1700000000L;
static const int64_t one_day = 86400L;

// ledger with the marketplace program deployed
struct market_env
{
  market_env() : clnt_( bk_ ) {
    bk_.add_program( &mkt_ );
    bk_.set_clock( test_now );
  }
  bank           bk_;
  market_program mkt_;
  market_client  clnt_;
};

// funded wallet registered under role
static void add_user( market_env& env, key_pair& kp, str name,
                      user_role role, uint64_t lamports )
{
  LP_TEST_CHECK( kp.gen() );
  if ( lamports ) {
    LP_TEST_CHECK( env.bk_.airdrop( pub_key( kp ), lamports ) );
  }
  LP_TEST_CHECK( e_success == env.clnt_.register_user( kp, name, role ) );
}

static account get_account( market_env& env, const pub_key& key )
{
  account acc;
  env.bk_.get_account_db().get( key, acc );
  return acc;
}

static err_code send( market_env& env, const instruction& ins,
                      const key_pair& kp )
{
  return env.clnt_.send( instruction_vec_t( 1, ins ),
                         signer_vec_t( 1, &kp ) );
}

void test_scenario()
{
  market_env env;
  key_pair client, fl1, fl2;
  add_user( env, client, "Carol", e_client, 1000 );
  add_user( env, fl1, "Frank", e_freelancer, 0 );
  add_user( env, fl2, "Fiona", e_freelancer, 0 );
  pub_key pc( client ), pf1( fl1 ), pf2( fl2 );

  user_account user;
  LP_TEST_CHECK( env.clnt_.get_user( pc, user ) );
  LP_TEST_CHECK( user.wallet_ == pc );
  LP_TEST_CHECK( user.name_ == "Carol" );
  LP_TEST_CHECK( user.role_ == e_client );

  // post job, escrow holds amount
  pub_key job;
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Logo", "design a logo", 100, opt_ts(), opt_ts(), job ) );
  job_post jp;
  LP_TEST_CHECK( env.clnt_.get_job( job, jp ) );
  LP_TEST_CHECK( jp.client_ == pc );
  LP_TEST_CHECK( jp.title_ == "Logo" );
  LP_TEST_CHECK( jp.amount_ == 100 );
  LP_TEST_CHECK( !jp.is_filled_ );
  LP_TEST_CHECK( !jp.start_date_.has_val_ );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 100 );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 900 );
  pub_key esc;
  LP_TEST_CHECK( find_escrow_address( job, esc ) );
  account esc_acc = get_account( env, esc );
  LP_TEST_CHECK( esc_acc.owner_ == get_market_program_id() );
  LP_TEST_CHECK( esc_acc.data_.empty() );

  // two applications
  pub_key app1, app2;
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl1, job, "r1", opt_ts(), app1 ) );
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl2, job, "r2", opt_ts( test_now + one_day ), app2 ) );
  application app;
  LP_TEST_CHECK( env.clnt_.get_application( app1, app ) );
  LP_TEST_CHECK( app.applicant_ == pf1 );
  LP_TEST_CHECK( app.job_post_ == job );
  LP_TEST_CHECK( app.resume_link_ == "r1" );
  LP_TEST_CHECK( !app.approved_ && !app.completed_ && !app.paid_ );
  key_app_vec_t appv;
  env.clnt_.list_applications( job, appv );
  LP_TEST_CHECK( appv.size() == 2 );

  // approve first applicant, second approval fails
  LP_TEST_CHECK( e_success ==
      env.clnt_.approve_application( client, job, app1 ) );
  LP_TEST_CHECK( env.clnt_.get_job( job, jp ) );
  LP_TEST_CHECK( jp.is_filled_ );
  LP_TEST_CHECK( env.clnt_.get_application( app1, app ) );
  LP_TEST_CHECK( app.approved_ );
  LP_TEST_CHECK( e_job_already_filled ==
      env.clnt_.approve_application( client, job, app2 ) );
  LP_TEST_CHECK( env.clnt_.get_application( app2, app ) );
  LP_TEST_CHECK( !app.approved_ );

  // work submission
  LP_TEST_CHECK( e_success ==
      env.clnt_.submit_work( fl1, app1, "link1", "done" ) );
  LP_TEST_CHECK( env.clnt_.get_application( app1, app ) );
  LP_TEST_CHECK( app.completed_ );
  LP_TEST_CHECK( app.submission_link_ == "link1" );
  LP_TEST_CHECK( app.narration_ == "done" );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 100 );

  // sign-off releases escrow
  LP_TEST_CHECK( e_success ==
      env.clnt_.approve_submission( client, job, app1, "great" ) );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 0 );
  LP_TEST_CHECK( env.clnt_.get_balance( pf1 ) == 100 );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 900 );
  LP_TEST_CHECK( env.clnt_.get_application( app1, app ) );
  LP_TEST_CHECK( app.client_review_ == "great" );
  LP_TEST_CHECK( app.paid_ );

  // payout is one-shot
  LP_TEST_CHECK( e_already_paid ==
      env.clnt_.approve_submission( client, job, app1, "again" ) );
  LP_TEST_CHECK( e_already_paid ==
      env.clnt_.submit_work( fl1, app1, "link2", "redo" ) );
  LP_TEST_CHECK( env.clnt_.get_balance( pf1 ) == 100 );

  // at most one approved application per job
  env.clnt_.list_applications( job, appv );
  unsigned num_approved = 0;
  for( const key_app_t& ka: appv ) {
    num_approved += ka.second.approved_;
  }
  LP_TEST_CHECK( num_approved == 1 );
}

void test_post_job()
{
  market_env env;
  key_pair client, fl, stranger;
  add_user( env, client, "Carol", e_client, 1000 );
  add_user( env, fl, "Frank", e_freelancer, 1000 );
  LP_TEST_CHECK( stranger.gen() );
  LP_TEST_CHECK( env.bk_.airdrop( pub_key( stranger ), 1000 ) );
  pub_key pc( client );
  pub_key job;

  // start date in the past
  LP_TEST_CHECK( e_invalid_dates == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts( test_now - 1 ),
        opt_ts( test_now + one_day ), job ) );
  LP_TEST_CHECK( !env.bk_.get_account_db().exists( job ) );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 0 );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 1000 );

  // start after end, single date
  LP_TEST_CHECK( e_invalid_dates == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts( test_now + 2*one_day ),
        opt_ts( test_now + one_day ), job ) );
  LP_TEST_CHECK( e_invalid_dates == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts( test_now + one_day ),
        opt_ts(), job ) );
  LP_TEST_CHECK( e_invalid_dates == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts(),
        opt_ts( test_now + one_day ), job ) );

  // amount and field limits
  LP_TEST_CHECK( e_invalid_amount == env.clnt_.post_job(
        client, "Logo", "d", 0, opt_ts(), opt_ts(), job ) );
  std::string title( max_title_len + 1, 't' );
  LP_TEST_CHECK( e_field_too_long == env.clnt_.post_job(
        client, title, "d", 100, opt_ts(), opt_ts(), job ) );
  std::string desc( max_description_len + 1, 'd' );
  LP_TEST_CHECK( e_field_too_long == env.clnt_.post_job(
        client, "Logo", desc, 100, opt_ts(), opt_ts(), job ) );

  // funds
  LP_TEST_CHECK( e_insufficient_funds == env.clnt_.post_job(
        client, "Logo", "d", 1001, opt_ts(), opt_ts(), job ) );
  LP_TEST_CHECK( !env.bk_.get_account_db().exists( job ) );

  // roles
  LP_TEST_CHECK( e_unauthorized == env.clnt_.post_job(
        fl, "Logo", "d", 100, opt_ts(), opt_ts(), job ) );
  LP_TEST_CHECK( e_unauthorized == env.clnt_.post_job(
        stranger, "Logo", "d", 100, opt_ts(), opt_ts(), job ) );
  LP_TEST_CHECK( env.clnt_.get_balance( pub_key( fl ) ) == 1000 );

  // start exactly now is accepted, dates kept
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts( test_now ),
        opt_ts( test_now + one_day ), job ) );
  job_post jp;
  LP_TEST_CHECK( env.clnt_.get_job( job, jp ) );
  LP_TEST_CHECK( jp.start_date_.has_val_ );
  LP_TEST_CHECK( jp.start_date_.val_ == test_now );
  LP_TEST_CHECK( jp.end_date_.val_ == test_now + one_day );

  // one job per client and title
  pub_key job2;
  LP_TEST_CHECK( e_already_exists == env.clnt_.post_job(
        client, "Logo", "other", 100, opt_ts(), opt_ts(), job2 ) );
  LP_TEST_CHECK( job2 == job );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 900 );

  // maximum sized fields fit
  std::string mtitle( max_title_len, 't' );
  std::string mdesc( max_description_len, 'd' );
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, mtitle, mdesc, 100, opt_ts(), opt_ts(), job2 ) );
  key_job_vec_t jobv;
  env.clnt_.list_jobs( jobv );
  LP_TEST_CHECK( jobv.size() == 2 );

  // escrow funded by a third party ahead of posting
  pub_key job3, esc3;
  LP_TEST_CHECK( find_job_address( pc, "Icon", job3 ) );
  LP_TEST_CHECK( find_escrow_address( job3, esc3 ) );
  LP_TEST_CHECK( e_success == env.clnt_.transfer( stranger, esc3, 5 ) );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 800 );
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Icon", "d", 100, opt_ts(), opt_ts(), job3 ) );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job3 ) == 100 );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 705 );

  // job address funded by a third party ahead of posting
  pub_key job4;
  LP_TEST_CHECK( find_job_address( pc, "Poster", job4 ) );
  LP_TEST_CHECK( e_success == env.clnt_.transfer( stranger, job4, 3 ) );
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Poster", "d", 100, opt_ts(), opt_ts(), job4 ) );
  LP_TEST_CHECK( env.clnt_.get_job( job4, jp ) );
  LP_TEST_CHECK( jp.title_ == "Poster" );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job4 ) == 100 );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 605 );
  LP_TEST_CHECK( env.clnt_.get_balance( job4 ) == 3 );

  // records and escrows only change through the marketplace
  LP_TEST_CHECK( e_invalid_account_data ==
      env.clnt_.transfer( stranger, esc3, 1 ) );
  LP_TEST_CHECK( e_invalid_account_data ==
      env.clnt_.transfer( stranger, job3, 1 ) );
  LP_TEST_CHECK( !env.bk_.airdrop( esc3, 1 ) );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job3 ) == 100 );
  LP_TEST_CHECK( env.clnt_.get_balance( pub_key( stranger ) ) == 992 );

  // escrow account not derived from the job
  instruction ins;
  LP_TEST_CHECK( market_tx::initialize_job_post(
        ins, pc, "Banner", "d", 100, opt_ts(), opt_ts() ) );
  ins.accs_[1].key_ = esc3;
  LP_TEST_CHECK( e_account_mismatch == send( env, ins, client ) );

  // identity record of another wallet
  LP_TEST_CHECK( market_tx::initialize_job_post(
        ins, pub_key( stranger ), "Banner", "d", 100, opt_ts(), opt_ts() ) );
  pub_key cuser;
  LP_TEST_CHECK( find_user_address( pc, cuser ) );
  ins.accs_[3].key_ = cuser;
  LP_TEST_CHECK( e_unauthorized == send( env, ins, stranger ) );
}

void test_register()
{
  market_env env;
  key_pair kp;
  add_user( env, kp, "Carol", e_client, 0 );
  LP_TEST_CHECK( e_already_exists ==
      env.clnt_.register_user( kp, "Carol", e_client ) );
  LP_TEST_CHECK( e_already_exists ==
      env.clnt_.register_user( kp, "Carol", e_freelancer ) );
  user_account user;
  LP_TEST_CHECK( env.clnt_.get_user( pub_key( kp ), user ) );
  LP_TEST_CHECK( user.role_ == e_client );

  key_pair kp2;
  LP_TEST_CHECK( kp2.gen() );
  std::string name( max_name_len + 1, 'n' );
  LP_TEST_CHECK( e_field_too_long ==
      env.clnt_.register_user( kp2, name, e_client ) );
  LP_TEST_CHECK( !env.clnt_.get_user( pub_key( kp2 ), user ) );
  name.resize( max_name_len );
  LP_TEST_CHECK( e_success ==
      env.clnt_.register_user( kp2, name, e_freelancer ) );

  // identity address funded before registration
  key_pair donor, late;
  add_user( env, donor, "Dora", e_client, 1000 );
  LP_TEST_CHECK( late.gen() );
  pub_key late_user;
  LP_TEST_CHECK( find_user_address( pub_key( late ), late_user ) );
  LP_TEST_CHECK( e_success == env.clnt_.transfer( donor, late_user, 7 ) );
  pub_key job;
  LP_TEST_CHECK( e_unauthorized == env.clnt_.post_job(
        late, "Logo", "d", 1, opt_ts(), opt_ts(), job ) );
  LP_TEST_CHECK( !env.clnt_.get_user( pub_key( late ), user ) );
  LP_TEST_CHECK( e_success ==
      env.clnt_.register_user( late, "Lena", e_client ) );
  LP_TEST_CHECK( env.clnt_.get_user( pub_key( late ), user ) );
  LP_TEST_CHECK( user.wallet_ == pub_key( late ) );
  LP_TEST_CHECK( user.name_ == "Lena" );
  LP_TEST_CHECK( env.clnt_.get_balance( late_user ) == 7 );
  LP_TEST_CHECK( e_already_exists ==
      env.clnt_.register_user( late, "Lena", e_client ) );

  // identity record under another wallet's address
  key_pair kp3;
  LP_TEST_CHECK( kp3.gen() );
  instruction ins;
  LP_TEST_CHECK( market_tx::register_user(
        ins, pub_key( kp3 ), "Mallory", e_client ) );
  pub_key other;
  LP_TEST_CHECK( find_user_address( pub_key( kp ), other ) );
  ins.accs_[0].key_ = other;
  LP_TEST_CHECK( e_invalid_seeds == send( env, ins, kp3 ) );

  // unknown instruction
  instruction bad;
  bad.prog_ = get_market_program_id();
  bad.add_account( pub_key( kp ), true, true );
  bad.data_.assign( disc_len, 0 );
  LP_TEST_CHECK( e_invalid_instruction == send( env, bad, kp ) );
  bad.data_.clear();
  LP_TEST_CHECK( e_invalid_instruction == send( env, bad, kp ) );
}

void test_apply()
{
  market_env env;
  key_pair client, fl;
  add_user( env, client, "Carol", e_client, 1000 );
  add_user( env, fl, "Frank", e_freelancer, 0 );
  pub_key job, app;
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts(), opt_ts(), job ) );

  // clients do not apply
  LP_TEST_CHECK( e_unauthorized == env.clnt_.apply_to_job(
        client, job, "r", opt_ts(), app ) );
  LP_TEST_CHECK( !env.bk_.get_account_db().exists( app ) );

  // validation
  LP_TEST_CHECK( e_invalid_dates == env.clnt_.apply_to_job(
        fl, job, "r", opt_ts( -1 ), app ) );
  std::string link( max_link_len + 1, 'l' );
  LP_TEST_CHECK( e_field_too_long == env.clnt_.apply_to_job(
        fl, job, link, opt_ts(), app ) );

  // job must exist
  pub_key nojob;
  LP_TEST_CHECK( find_job_address( pub_key( client ), "none", nojob ) );
  LP_TEST_CHECK( e_invalid_account_data == env.clnt_.apply_to_job(
        fl, nojob, "r", opt_ts(), app ) );

  // application address funded by a third party ahead of applying
  LP_TEST_CHECK( find_application_address( job, pub_key( fl ), app ) );
  LP_TEST_CHECK( e_success == env.clnt_.transfer( client, app, 2 ) );

  // one application per job and applicant
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl, job, "r", opt_ts(), app ) );
  LP_TEST_CHECK( env.clnt_.get_balance( app ) == 2 );
  pub_key app2;
  LP_TEST_CHECK( e_already_exists == env.clnt_.apply_to_job(
        fl, job, "r2", opt_ts(), app2 ) );
  application rec;
  LP_TEST_CHECK( env.clnt_.get_application( app, rec ) );
  LP_TEST_CHECK( rec.resume_link_ == "r" );

  // filled jobs still accept applications
  LP_TEST_CHECK( e_success ==
      env.clnt_.approve_application( client, job, app ) );
  key_pair fl2;
  add_user( env, fl2, "Fiona", e_freelancer, 0 );
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl2, job, "r", opt_ts(), app2 ) );
  LP_TEST_CHECK( e_job_already_filled ==
      env.clnt_.approve_application( client, job, app2 ) );
}

void test_approve_application()
{
  market_env env;
  key_pair client, client2, fl;
  add_user( env, client, "Carol", e_client, 1000 );
  add_user( env, client2, "Chris", e_client, 1000 );
  add_user( env, fl, "Frank", e_freelancer, 0 );
  pub_key job1, job2, app1, app2;
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts(), opt_ts(), job1 ) );
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Icon", "d", 200, opt_ts(), opt_ts(), job2 ) );

  // no application record yet
  pub_key noapp;
  LP_TEST_CHECK( find_application_address( job1, pub_key( fl ), noapp ) );
  LP_TEST_CHECK( e_invalid_account_data ==
      env.clnt_.approve_application( client, job1, noapp ) );

  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl, job1, "r", opt_ts(), app1 ) );
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl, job2, "r", opt_ts(), app2 ) );
  account pre_job = get_account( env, job1 );
  account pre_app = get_account( env, app1 );

  // only the posting client approves
  LP_TEST_CHECK( e_unauthorized ==
      env.clnt_.approve_application( client2, job1, app1 ) );
  LP_TEST_CHECK( e_unauthorized ==
      env.clnt_.approve_application( fl, job1, app1 ) );

  // application of another job
  LP_TEST_CHECK( e_account_mismatch ==
      env.clnt_.approve_application( client, job1, app2 ) );

  // failed checks leave records untouched
  LP_TEST_CHECK( get_account( env, job1 ) == pre_job );
  LP_TEST_CHECK( get_account( env, app1 ) == pre_app );

  // job passed read-only
  instruction ins;
  LP_TEST_CHECK( market_tx::approve_application(
        ins, pub_key( client ), job1, app1 ) );
  ins.accs_[1].is_writable_ = false;
  LP_TEST_CHECK( e_readonly_modified == send( env, ins, client ) );
  LP_TEST_CHECK( get_account( env, job1 ) == pre_job );

  LP_TEST_CHECK( e_success ==
      env.clnt_.approve_application( client, job1, app1 ) );
  LP_TEST_CHECK( e_job_already_filled ==
      env.clnt_.approve_application( client, job1, app1 ) );
}

void test_submit_work()
{
  market_env env;
  key_pair client, fl, fl2;
  add_user( env, client, "Carol", e_client, 1000 );
  add_user( env, fl, "Frank", e_freelancer, 0 );
  add_user( env, fl2, "Fiona", e_freelancer, 0 );
  pub_key job, app, app2;
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Logo", "d", 100, opt_ts(), opt_ts(), job ) );
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl, job, "r", opt_ts(), app ) );
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl2, job, "r", opt_ts(), app2 ) );

  // not yet approved
  LP_TEST_CHECK( e_application_not_approved ==
      env.clnt_.submit_work( fl, app, "link", "n" ) );
  LP_TEST_CHECK( e_success ==
      env.clnt_.approve_application( client, job, app ) );

  // only the applicant submits
  LP_TEST_CHECK( e_unauthorized ==
      env.clnt_.submit_work( fl2, app, "link", "n" ) );
  LP_TEST_CHECK( e_unauthorized ==
      env.clnt_.submit_work( client, app, "link", "n" ) );
  LP_TEST_CHECK( e_application_not_approved ==
      env.clnt_.submit_work( fl2, app2, "link", "n" ) );

  // limits
  std::string link( max_link_len + 1, 'l' );
  std::string narration( max_narration_len + 1, 'n' );
  LP_TEST_CHECK( e_field_too_long ==
      env.clnt_.submit_work( fl, app, link, "n" ) );
  LP_TEST_CHECK( e_field_too_long ==
      env.clnt_.submit_work( fl, app, "link", narration ) );
  application rec;
  LP_TEST_CHECK( env.clnt_.get_application( app, rec ) );
  LP_TEST_CHECK( !rec.completed_ );

  // re-submission before payout replaces the previous one
  LP_TEST_CHECK( e_success == env.clnt_.submit_work( fl, app, "v1", "a" ) );
  LP_TEST_CHECK( e_success == env.clnt_.submit_work( fl, app, "v2", "b" ) );
  LP_TEST_CHECK( env.clnt_.get_application( app, rec ) );
  LP_TEST_CHECK( rec.completed_ );
  LP_TEST_CHECK( rec.submission_link_ == "v2" );
  LP_TEST_CHECK( rec.narration_ == "b" );

  // unknown application
  pub_key noapp;
  LP_TEST_CHECK( find_application_address( job, pub_key( client ), noapp ) );
  LP_TEST_CHECK( e_invalid_account_data ==
      env.clnt_.submit_work( fl, noapp, "link", "n" ) );
}

void test_approve_submission()
{
  market_env env;
  key_pair client, client2, fl, fl2;
  add_user( env, client, "Carol", e_client, 1000 );
  add_user( env, client2, "Chris", e_client, 1000 );
  add_user( env, fl, "Frank", e_freelancer, 0 );
  add_user( env, fl2, "Fiona", e_freelancer, 0 );
  pub_key pc( client ), pf( fl ), pf2( fl2 );
  pub_key job, app;
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Logo", "d", 300, opt_ts(), opt_ts(), job ) );
  LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
        fl, job, "r", opt_ts(), app ) );
  LP_TEST_CHECK( e_success ==
      env.clnt_.approve_application( client, job, app ) );

  // work not yet submitted
  LP_TEST_CHECK( e_work_not_completed ==
      env.clnt_.approve_submission( client, job, app, "ok" ) );
  LP_TEST_CHECK( e_success == env.clnt_.submit_work( fl, app, "l", "n" ) );
  account pre_app = get_account( env, app );

  // only the posting client signs off
  LP_TEST_CHECK( e_unauthorized ==
      env.clnt_.approve_submission( client2, job, app, "ok" ) );
  LP_TEST_CHECK( e_unauthorized ==
      env.clnt_.approve_submission( fl, job, app, "ok" ) );
  std::string review( max_review_len + 1, 'r' );
  LP_TEST_CHECK( e_field_too_long ==
      env.clnt_.approve_submission( client, job, app, review ) );

  // payout to someone other than the applicant
  instruction ins;
  LP_TEST_CHECK( market_tx::approve_submission(
        ins, pc, job, app, pf2, "ok" ) );
  LP_TEST_CHECK( e_account_mismatch == send( env, ins, client ) );

  // escrow of another job
  pub_key job2, esc2;
  LP_TEST_CHECK( e_success == env.clnt_.post_job(
        client, "Icon", "d", 300, opt_ts(), opt_ts(), job2 ) );
  LP_TEST_CHECK( find_escrow_address( job2, esc2 ) );
  LP_TEST_CHECK( market_tx::approve_submission(
        ins, pc, job, app, pf, "ok" ) );
  ins.accs_[2].key_ = esc2;
  LP_TEST_CHECK( e_account_mismatch == send( env, ins, client ) );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job2 ) == 300 );

  // escrow cannot be spent by signature
  pub_key esc;
  LP_TEST_CHECK( find_escrow_address( job, esc ) );
  tx::transfer( ins, esc, pc, 300 );
  ins.accs_[0].is_signer_ = false;
  LP_TEST_CHECK( e_missing_signature == send( env, ins, client ) );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 300 );

  // failed checks leave state untouched
  LP_TEST_CHECK( get_account( env, app ) == pre_app );
  LP_TEST_CHECK( env.clnt_.get_balance( pf ) == 0 );

  // custodian balance disagrees with the job amount
  {
    job_post jp;
    LP_TEST_CHECK( env.clnt_.get_job( job, jp ) );
    account esc_acc = get_account( env, esc );
    esc_acc.lamports_ += 1;
    acc_info_vec_t infov( 1 );
    infov[0].key_ = esc;
    infov[0].is_writable_ = true;
    infov[0].acc_ = &esc_acc;
    invoke_ctx ctx( get_market_program_id(), test_now, infov );
    LP_TEST_CHECK( e_escrow_mismatch ==
        escrow::check( ctx, job, jp, infov[0] ) );
    esc_acc.lamports_ -= 1;
    LP_TEST_CHECK( e_success == escrow::check( ctx, job, jp, infov[0] ) );
  }

  // third party top ups of the escrow are refused
  LP_TEST_CHECK( e_invalid_account_data ==
      env.clnt_.transfer( client2, esc, 1 ) );
  LP_TEST_CHECK( !env.bk_.airdrop( esc, 1 ) );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 300 );
  LP_TEST_CHECK( get_account( env, app ) == pre_app );

  // payout still completes
  LP_TEST_CHECK( e_success ==
      env.clnt_.approve_submission( client, job, app, "ok" ) );
  LP_TEST_CHECK( env.clnt_.get_balance( pf ) == 300 );
  LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 0 );
  LP_TEST_CHECK( !env.bk_.get_account_db().exists( esc ) );
  LP_TEST_CHECK( env.clnt_.get_balance( pc ) == 400 );
  LP_TEST_CHECK( env.clnt_.get_balance( pub_key( client2 ) ) == 1000 );
}

void test_persistence()
{
  char tmpl[] = "/tmp/lp_test_market_XXXXXX";
  LP_TEST_CHECK( ::mkdtemp( tmpl ) );
  std::string file = std::string( tmpl ) + "/ledger.gz";
  key_pair client, fl;
  pub_key job, app;
  {
    market_env env;
    add_user( env, client, "Carol", e_client, 1000 );
    add_user( env, fl, "Frank", e_freelancer, 0 );
    LP_TEST_CHECK( e_success == env.clnt_.post_job(
          client, "Logo", "d", 100, opt_ts(), opt_ts(), job ) );
    LP_TEST_CHECK( e_success == env.clnt_.apply_to_job(
          fl, job, "r", opt_ts(), app ) );
    LP_TEST_CHECK( env.bk_.save( file ) );
  }
  {
    market_env env;
    LP_TEST_CHECK( env.bk_.load( file ) );
    job_post jp;
    LP_TEST_CHECK( env.clnt_.get_job( job, jp ) );
    LP_TEST_CHECK( jp.title_ == "Logo" );
    LP_TEST_CHECK( env.clnt_.get_escrow_balance( job ) == 100 );
    LP_TEST_CHECK( e_success ==
        env.clnt_.approve_application( client, job, app ) );
    LP_TEST_CHECK( e_success ==
        env.clnt_.submit_work( fl, app, "l", "n" ) );
    LP_TEST_CHECK( e_success ==
        env.clnt_.approve_submission( client, job, app, "great" ) );
    LP_TEST_CHECK( env.clnt_.get_balance( pub_key( fl ) ) == 100 );
  }
  ::unlink( file.c_str() );
  ::rmdir( tmpl );
}

int main(int,char**)
{
  LP_TEST_START
  test_scenario();
  test_post_job();
  test_register();
  test_apply();
  test_approve_application();
  test_submit_work();
  test_approve_submission();
  test_persistence();
  LP_TEST_END
  return 0;
}
