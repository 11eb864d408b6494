#pragma once

#include <lp/program.hpp>
#include <lp/auth_guard.hpp>
#include <lp/escrow.hpp>

namespace lp
{

  // escrow-backed job marketplace program
  //
  // identity registry : register_user
  // job ledger        : initialize_job_post (funds the job escrow)
  // application ledger: apply_to_job, approve_application, submit_work,
  //                     approve_submission (releases the job escrow)
  //
  // per job: open -> filled -> work submitted -> paid
  class market_program : public program
  {
  public:

    const pub_key& get_id() const override;
    str get_name() const override;
    err_code process( invoke_ctx&, const uint8_t *, size_t ) override;

  private:

    err_code register_user( invoke_ctx&, bindec& );
    err_code initialize_job_post( invoke_ctx&, bindec& );
    err_code apply_to_job( invoke_ctx&, bindec& );
    err_code approve_application( invoke_ctx&, bindec& );
    err_code submit_work( invoke_ctx&, bindec& );
    err_code approve_submission( invoke_ctx&, bindec& );

    // write record into program-owned account
    template<class T>
    static err_code store( acc_info&, const T& );
  };

  template<class T>
  err_code market_program::store( acc_info& info, const T& rec )
  {
    if ( !rec.encode( info.acc_->data_ ) ) {
      return e_field_too_long;
    }
    return e_success;
  }

}
