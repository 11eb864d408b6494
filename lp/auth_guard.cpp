#include "auth_guard.hpp"

using namespace lp;

auth_guard::auth_guard( invoke_ctx& ctx )
: ctx_( ctx )
{
}

err_code auth_guard::check_signer( const acc_info& signer ) const
{
  if ( !signer.is_signer_ ) {
    return e_missing_signature;
  }
  if ( !signer.is_writable_ ) {
    return e_unauthorized;
  }
  return e_success;
}

err_code auth_guard::load_identity( const acc_info& signer,
                                    const acc_info& user,
                                    user_account& rec ) const
{
  err_code rc = check_signer( signer );
  if ( rc != e_success ) {
    return rc;
  }

  // identity record must be the one derived from the signer
  pda_seeds seeds;
  seeds.init_user( signer.key_ );
  pub_key addr;
  if ( !seeds.find( ctx_.get_program_id(), addr ) || addr != user.key_ ) {
    return e_unauthorized;
  }
  // no identity record yet, possibly holding stray lamports
  if ( user.acc_->owner_ != ctx_.get_program_id() ) {
    return e_unauthorized;
  }
  rc = load( user, rec );
  if ( rc != e_success ) {
    return rc;
  }
  if ( rec.wallet_ != signer.key_ ) {
    return e_unauthorized;
  }
  return e_success;
}

err_code auth_guard::require_role( const user_account& user,
                                   user_role role ) const
{
  return user.role_ == role ? e_success : e_unauthorized;
}

err_code auth_guard::require_job_client( const user_account& user,
                                         const job_post& job ) const
{
  if ( job.client_ != user.wallet_ ) {
    return e_unauthorized;
  }
  return require_role( user, e_client );
}

err_code auth_guard::require_applicant( const user_account& user,
                                        const application& app ) const
{
  err_code rc = require_role( user, e_freelancer );
  if ( rc != e_success ) {
    return rc;
  }
  return app.applicant_ == user.wallet_ ? e_success : e_unauthorized;
}
