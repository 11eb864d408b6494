#pragma once

#include <lp/bank.hpp>
#include <lp/market_tx.hpp>
#include <lp/market_types.hpp>

namespace lp
{

  typedef std::pair<pub_key,job_post>     key_job_t;
  typedef std::vector<key_job_t>          key_job_vec_t;
  typedef std::pair<pub_key,application>  key_app_t;
  typedef std::vector<key_app_t>          key_app_vec_t;

  // builds, signs and submits marketplace transactions to a bank
  class market_client
  {
  public:

    explicit market_client( bank& );

    // wallet transfer through the system program
    err_code transfer( const key_pair& from,
                       const pub_key& to,
                       uint64_t lamports );

    err_code register_user( const key_pair&, str name, user_role );

    // job address returned in job
    err_code post_job( const key_pair&,
                       str title,
                       str description,
                       uint64_t amount,
                       const opt_ts& start_date,
                       const opt_ts& end_date,
                       pub_key& job );

    // application address returned in app
    err_code apply_to_job( const key_pair&,
                           const pub_key& job,
                           str resume_link,
                           const opt_ts& expected_end_date,
                           pub_key& app );

    err_code approve_application( const key_pair&,
                                  const pub_key& job,
                                  const pub_key& app );

    // job is taken from the application record
    err_code submit_work( const key_pair&,
                          const pub_key& app,
                          str submission_link,
                          str narration );

    // freelancer is taken from the application record
    err_code approve_submission( const key_pair&,
                                 const pub_key& job,
                                 const pub_key& app,
                                 str client_review );

    // submit arbitrary instructions signed by signers
    err_code send( const instruction_vec_t&, const signer_vec_t& );

    // record queries against committed state
    bool get_user( const pub_key& wallet, user_account& ) const;
    bool get_job( const pub_key& job, job_post& ) const;
    bool get_application( const pub_key& app, application& ) const;
    uint64_t get_balance( const pub_key& ) const;
    uint64_t get_escrow_balance( const pub_key& job ) const;
    void list_jobs( key_job_vec_t& ) const;
    void list_applications( const pub_key& job, key_app_vec_t& ) const;

  private:
    err_code send( const instruction&, const key_pair& );
    template<class T> bool get_record( const pub_key&, T& ) const;
    bank& bk_;
  };

}
