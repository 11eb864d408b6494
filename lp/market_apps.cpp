#include "market.hpp"
#include "log.hpp"

using namespace lp;

// accounts: application(w), signer(w,s), user, job_post
err_code market_program::apply_to_job( invoke_ctx& ctx, bindec& rdr )
{
  application app;
  if ( ctx.get_num_accounts() != 4 ||
       !rdr.get_str( app.resume_link_ ) ||
       !rdr.get_opt( app.expected_end_date_.has_val_,
                     app.expected_end_date_.val_ ) ||
       rdr.get_left() ) {
    return e_invalid_instruction;
  }
  acc_info& aacc = ctx.get_account( 0 );
  acc_info& signer = ctx.get_account( 1 );
  acc_info& user = ctx.get_account( 2 );
  acc_info& jacc = ctx.get_account( 3 );

  // only freelancers apply
  auth_guard guard( ctx );
  user_account freelancer;
  err_code rc = guard.load_identity( signer, user, freelancer );
  if ( rc == e_success ) {
    rc = guard.require_role( freelancer, e_freelancer );
  }
  if ( rc != e_success ) {
    return rc;
  }
  if ( app.expected_end_date_.has_val_ && app.expected_end_date_.val_ < 0 ) {
    return e_invalid_dates;
  }
  if ( app.resume_link_.length() > max_link_len ) {
    return e_field_too_long;
  }
  job_post job;
  rc = guard.load( jacc, job );
  if ( rc != e_success ) {
    return rc;
  }

  // allocate application at ["application", job_post, applicant]
  pda_seeds seeds;
  pub_key addr;
  seeds.init_application( jacc.key_, signer.key_ );
  if ( !seeds.find( ctx.get_program_id(), addr ) ) {
    return e_invalid_seeds;
  }
  rc = ctx.create_account( signer, aacc, 0, application::space,
                           ctx.get_program_id(), &seeds.get_seeds() );
  if ( rc != e_success ) {
    return rc;
  }
  app.applicant_ = signer.key_;
  app.job_post_ = jacc.key_;
  rc = store( aacc, app );
  if ( rc != e_success ) {
    return rc;
  }
  LP_LOG_DBG( "application submitted" )
    .add( "application", aacc.key_ )
    .add( "job", app.job_post_ )
    .add( "applicant", app.applicant_ )
    .add( "resume_link", app.resume_link_ )
    .end();
  return e_success;
}

// accounts: application(w), job_post(w), signer(w,s), user
err_code market_program::approve_application( invoke_ctx& ctx, bindec& rdr )
{
  if ( ctx.get_num_accounts() != 4 || rdr.get_left() ) {
    return e_invalid_instruction;
  }
  acc_info& aacc = ctx.get_account( 0 );
  acc_info& jacc = ctx.get_account( 1 );
  acc_info& signer = ctx.get_account( 2 );
  acc_info& user = ctx.get_account( 3 );

  auth_guard guard( ctx );
  user_account client;
  job_post job;
  application app;
  err_code rc = guard.load_identity( signer, user, client );
  if ( rc == e_success ) {
    rc = guard.load( jacc, job );
  }
  if ( rc == e_success ) {
    rc = guard.load( aacc, app );
  }
  if ( rc == e_success ) {
    rc = guard.require_job_client( client, job );
  }
  if ( rc != e_success ) {
    return rc;
  }
  if ( app.job_post_ != jacc.key_ ) {
    return e_account_mismatch;
  }

  // single point of mutual exclusion per job
  if ( job.is_filled_ ) {
    return e_job_already_filled;
  }
  app.approved_ = true;
  job.is_filled_ = true;
  rc = store( aacc, app );
  if ( rc == e_success ) {
    rc = store( jacc, job );
  }
  if ( rc != e_success ) {
    return rc;
  }
  LP_LOG_DBG( "application approved" )
    .add( "application", aacc.key_ )
    .add( "job", jacc.key_ )
    .add( "title", job.title_ )
    .end();
  return e_success;
}

// accounts: application(w), signer(w,s), user, job_post
err_code market_program::submit_work( invoke_ctx& ctx, bindec& rdr )
{
  std::string link, narration;
  if ( ctx.get_num_accounts() != 4 ||
       !rdr.get_str( link ) ||
       !rdr.get_str( narration ) ||
       rdr.get_left() ) {
    return e_invalid_instruction;
  }
  acc_info& aacc = ctx.get_account( 0 );
  acc_info& signer = ctx.get_account( 1 );
  acc_info& user = ctx.get_account( 2 );
  acc_info& jacc = ctx.get_account( 3 );

  auth_guard guard( ctx );
  user_account freelancer;
  application app;
  job_post job;
  err_code rc = guard.load_identity( signer, user, freelancer );
  if ( rc == e_success ) {
    rc = guard.load( aacc, app );
  }
  if ( rc == e_success ) {
    rc = guard.load( jacc, job );
  }
  if ( rc == e_success ) {
    rc = guard.require_applicant( freelancer, app );
  }
  if ( rc != e_success ) {
    return rc;
  }
  if ( app.job_post_ != jacc.key_ ) {
    return e_account_mismatch;
  }
  if ( !app.approved_ ) {
    return e_application_not_approved;
  }
  if ( app.paid_ ) {
    return e_already_paid;
  }
  if ( link.length() > max_link_len ||
       narration.length() > max_narration_len ) {
    return e_field_too_long;
  }

  // re-submission before payout overwrites
  app.submission_link_ = link;
  app.narration_ = narration;
  app.completed_ = true;
  rc = store( aacc, app );
  if ( rc != e_success ) {
    return rc;
  }
  LP_LOG_DBG( "work submitted" )
    .add( "application", aacc.key_ )
    .add( "job", jacc.key_ )
    .add( "submission_link", app.submission_link_ )
    .end();
  return e_success;
}

// accounts: application(w), job_post(w), escrow(w), signer(w,s), user,
// freelancer(w)
err_code market_program::approve_submission( invoke_ctx& ctx, bindec& rdr )
{
  std::string review;
  if ( ctx.get_num_accounts() != 6 ||
       !rdr.get_str( review ) ||
       rdr.get_left() ) {
    return e_invalid_instruction;
  }
  acc_info& aacc = ctx.get_account( 0 );
  acc_info& jacc = ctx.get_account( 1 );
  acc_info& esc = ctx.get_account( 2 );
  acc_info& signer = ctx.get_account( 3 );
  acc_info& user = ctx.get_account( 4 );
  acc_info& facc = ctx.get_account( 5 );

  auth_guard guard( ctx );
  user_account client;
  job_post job;
  application app;
  err_code rc = guard.load_identity( signer, user, client );
  if ( rc == e_success ) {
    rc = guard.load( jacc, job );
  }
  if ( rc == e_success ) {
    rc = guard.load( aacc, app );
  }
  if ( rc == e_success ) {
    rc = guard.require_job_client( client, job );
  }
  if ( rc != e_success ) {
    return rc;
  }
  if ( app.job_post_ != jacc.key_ || app.applicant_ != facc.key_ ) {
    return e_account_mismatch;
  }
  if ( !app.completed_ ) {
    return e_work_not_completed;
  }
  if ( app.paid_ ) {
    return e_already_paid;
  }
  if ( review.length() > max_review_len ) {
    return e_field_too_long;
  }
  rc = escrow::check( ctx, jacc.key_, job, esc );
  if ( rc != e_success ) {
    return rc;
  }

  // record review and mark paid before releasing funds
  app.client_review_ = review;
  app.paid_ = true;
  rc = store( aacc, app );
  if ( rc != e_success ) {
    return rc;
  }
  release_cap cap;
  rc = escrow::release( cap, ctx, jacc.key_, job, esc, facc );
  if ( rc != e_success ) {
    return rc;
  }
  LP_LOG_DBG( "submission approved" )
    .add( "application", aacc.key_ )
    .add( "job", jacc.key_ )
    .add( "freelancer", facc.key_ )
    .add( "amount", job.amount_ )
    .end();
  return e_success;
}
