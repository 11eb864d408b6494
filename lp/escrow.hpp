#pragma once

#include <lp/invoke_ctx.hpp>
#include <lp/market_types.hpp>

namespace lp
{

  class market_program;

  // authority to release escrowed funds
  // only the submission approval path of market_program can mint one
  class release_cap
  {
  private:
    release_cap();
    release_cap( const release_cap& );
    release_cap& operator=( const release_cap& );
    friend class market_program;
  };

  // custody of job funds in a program-derived account owned by the
  // marketplace program with no data
  // derived from the job post address, never controlled by a human key
  // and credited or debited only by the marketplace program
  class escrow
  {
  public:

    // find escrow address and bump for a new job post
    static err_code derive( const pub_key& prog,
                            const pub_key& job,
                            pub_key& addr,
                            uint8_t& bump );

    // move the job amount from the client wallet into a new escrow
    // lamports already at the escrow address go back to the client
    static err_code deposit( invoke_ctx&,
                             const pub_key& job_key,
                             acc_info& client,
                             acc_info& esc,
                             const job_post& );

    // check escrow account and balance against its job post
    static err_code check( invoke_ctx&,
                           const pub_key& job_key,
                           const job_post&,
                           const acc_info& esc );

    // debit full escrow balance to freelancer
    static err_code release( const release_cap&,
                             invoke_ctx&,
                             const pub_key& job_key,
                             const job_post&,
                             acc_info& esc,
                             acc_info& freelancer );
  };

}
