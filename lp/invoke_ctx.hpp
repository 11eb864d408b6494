#pragma once

#include <lp/account_db.hpp>
#include <lp/program.hpp>
#include <vector>

namespace lp
{

  // instruction account as seen by an executing program
  struct acc_info
  {
    acc_info();
    pub_key  key_;
    bool     is_signer_;
    bool     is_writable_;
    account *acc_;        // transaction-local working copy
    uint64_t sys_debit_;  // lamports debited through system services
  };

  typedef std::vector<acc_info> acc_info_vec_t;

  // execution context of a single instruction
  class invoke_ctx
  {
  public:

    invoke_ctx( const pub_key& prog_id, int64_t now, acc_info_vec_t& );

    // id of executing program
    const pub_key& get_program_id() const;

    // ledger clock in unix seconds
    int64_t get_unix_timestamp() const;

    // instruction accounts
    unsigned get_num_accounts() const;
    acc_info& get_account( unsigned );

    // allocate a system-owned account without data into a new account
    // owned by owner with space zeroed data bytes
    // existing lamports are kept, payer funds the rest up to lamports
    // new account must sign or be derived from seeds and this program
    err_code create_account( acc_info& payer,
                             acc_info& new_acc,
                             uint64_t lamports,
                             size_t space,
                             const pub_key& owner,
                             const seed_vec_t *seeds );

    // move lamports between system-owned accounts
    // accounts owned by other programs are never credited
    // source must sign or be derived from signer_seeds and this program
    err_code transfer( acc_info& from,
                       acc_info& to,
                       uint64_t lamports,
                       const seed_vec_t *signer_seeds );

  private:
    err_code check_authority( const acc_info&, const seed_vec_t * ) const;

    const pub_key&  prog_;
    int64_t         now_;
    acc_info_vec_t& accv_;
  };

  inline const pub_key& invoke_ctx::get_program_id() const
  {
    return prog_;
  }

  inline int64_t invoke_ctx::get_unix_timestamp() const
  {
    return now_;
  }

  inline unsigned invoke_ctx::get_num_accounts() const
  {
    return accv_.size();
  }

  inline acc_info& invoke_ctx::get_account( unsigned i )
  {
    return accv_[i];
  }

}
