#pragma once

#include <lp/tx.hpp>
#include <lp/market_types.hpp>

namespace lp
{

  // marketplace instruction construction
  // record addresses are derived from the signer and arguments
  // fails if an address cannot be derived or data exceeds a transaction
  namespace market_tx
  {

    bool register_user( instruction&,
                        const pub_key& signer,
                        str name,
                        user_role role );

    bool initialize_job_post( instruction&,
                              const pub_key& signer,
                              str title,
                              str description,
                              uint64_t amount,
                              const opt_ts& start_date,
                              const opt_ts& end_date );

    bool apply_to_job( instruction&,
                       const pub_key& signer,
                       const pub_key& job,
                       str resume_link,
                       const opt_ts& expected_end_date );

    bool approve_application( instruction&,
                              const pub_key& signer,
                              const pub_key& job,
                              const pub_key& app );

    bool submit_work( instruction&,
                      const pub_key& signer,
                      const pub_key& job,
                      const pub_key& app,
                      str submission_link,
                      str narration );

    bool approve_submission( instruction&,
                             const pub_key& signer,
                             const pub_key& job,
                             const pub_key& app,
                             const pub_key& freelancer,
                             str client_review );

  }

}
