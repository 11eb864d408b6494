#pragma once

#include <lp/invoke_ctx.hpp>
#include <lp/market_types.hpp>

namespace lp
{

  // role and ownership checks evaluated before any state change
  class auth_guard
  {
  public:

    explicit auth_guard( invoke_ctx& );

    // signer account signed the transaction and may pay
    err_code check_signer( const acc_info& signer ) const;

    // identity record of signer, registered under this program
    err_code load_identity( const acc_info& signer,
                            const acc_info& user,
                            user_account& ) const;

    // decode record owned by this program
    template<class T>
    err_code load( const acc_info&, T& ) const;

    // caller has role
    err_code require_role( const user_account&, user_role ) const;

    // caller is the client that posted the job
    err_code require_job_client( const user_account&,
                                 const job_post& ) const;

    // caller is the freelancer that applied
    err_code require_applicant( const user_account&,
                                const application& ) const;

  private:
    invoke_ctx& ctx_;
  };

  template<class T>
  err_code auth_guard::load( const acc_info& info, T& rec ) const
  {
    const account& acc = *info.acc_;
    if ( acc.owner_ != ctx_.get_program_id() || !rec.decode( acc.data_ ) ) {
      return e_invalid_account_data;
    }
    return e_success;
  }

}
