#pragma once

#include <lp/key_pair.hpp>
#include <lp/error.hpp>
#include <lp/bincode.hpp>
#include <lp/snapshot.hpp>
#include <unordered_map>
#include <vector>
#include <mutex>

namespace lp
{

  typedef std::vector<uint8_t> acc_data_t;

  // ledger account
  // an account with no lamports and no data does not exist
  struct account
  {
    account();
    bool is_empty() const;
    bool operator==( const account& ) const;
    bool operator!=( const account& ) const;

    pub_key    owner_;     // owning program id or zero for system
    uint64_t   lamports_;  // balance
    acc_data_t data_;      // program-owned state
  };

  typedef std::pair<pub_key,account>  key_account_t;
  typedef std::vector<key_account_t>  key_account_vec_t;

  // thread-safe store of accounts keyed by public key
  class account_db : public error
  {
  public:

    // copy of account, false if it does not exist
    bool get( const pub_key&, account& ) const;
    bool exists( const pub_key& ) const;
    uint64_t get_lamports( const pub_key& ) const;

    // store account or purge it if empty
    void put( const pub_key&, const account& );

    // credit system account out of thin air (faucet)
    bool add_lamports( const pub_key&, uint64_t lamports );

    // all accounts owned by program ordered by key
    void get_program_accounts( const pub_key& owner,
                               key_account_vec_t& ) const;

    size_t size() const;
    void clear();

    // snapshot section encoding
    bool save( snapshot& );
    bool load( bindec& );

  private:
    typedef std::unordered_map<pub_key,account,hash_bucket> acc_map_t;
    mutable std::mutex mtx_;
    acc_map_t          amap_;
  };

}
