#pragma once

#include <lp/account_db.hpp>
#include <lp/account_locks.hpp>
#include <lp/system_program.hpp>
#include <lp/tx.hpp>
#include <lp/error.hpp>
#include <unordered_map>
#include <unordered_set>
#include <deque>
#include <mutex>

namespace lp
{

  // hash functor for signature containers
  struct sig_bucket
  {
    size_t operator()( const signature& ) const;
  };

  // single-node ledger executing signed transactions atomically
  // transactions touching disjoint accounts run concurrently
  class bank : public error
  {
  public:

    // recent block hashes a transaction may reference
    static const size_t max_recent_hashes = 150;

    bank();

    // register program (not owned)
    void add_program( program * );
    program *get_program( const pub_key& ) const;

    // account storage
    account_db& get_account_db();
    const account_db& get_account_db() const;

    // override ledger clock (unix seconds), zero uses system time
    void set_clock( int64_t );
    int64_t get_clock() const;

    // latest block hash to reference from new transactions
    hash get_recent_hash() const;

    // number of successfully processed transactions
    uint64_t get_num_tx() const;

    // faucet funding of a system account
    bool airdrop( const pub_key&, uint64_t lamports );

    // verify, lock, execute and commit serialized transaction
    // nothing is committed unless every instruction succeeds
    err_code process( const char *buf, size_t len );

    // ledger snapshot persistence
    bool save( const std::string& file );
    bool load( const std::string& file );

  private:

    typedef std::unordered_map<pub_key,program*,hash_bucket> prog_map_t;
    typedef std::unordered_set<signature,sig_bucket>         sig_set_t;
    typedef std::vector<signature>                           sig_vec_t;
    typedef std::pair<hash,sig_vec_t>                        hash_sigs_t;
    typedef std::deque<hash_sigs_t>                          hash_queue_t;

    err_code check_recent( const tx_msg& );
    void release_sig( const tx_msg& );
    void commit_hash( const tx_msg& );
    err_code execute( const tx_msg&, int64_t now );
    err_code run_instr( const tx_msg&, const tx_msg::instr&,
                        std::vector<account>&, int64_t now );

    mutable std::mutex mtx_;    // protects hashes, signatures, counters
    system_program     sys_;
    prog_map_t         pmap_;
    account_db         adb_;
    account_locks      locks_;
    hash_queue_t       hq_;     // recent hashes oldest first
    sig_set_t          sigs_;   // signatures of recent transactions
    uint64_t           num_tx_;
    int64_t            clock_;
  };

  inline account_db& bank::get_account_db()
  {
    return adb_;
  }

  inline const account_db& bank::get_account_db() const
  {
    return adb_;
  }

}
