#pragma once

#include <lp/key_pair.hpp>
#include <unordered_map>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace lp
{

  typedef std::vector<pub_key> pub_key_vec_t;

  // per-account reader/writer locks taken all-or-nothing
  // a transaction waits until none of its accounts conflict with
  // an in-flight transaction and then holds all of them at once
  class account_locks
  {
  public:

    // block until write keys are exclusive and read keys are shared
    void lock( const pub_key_vec_t& wr, const pub_key_vec_t& rd );

    // non-blocking variant
    bool try_lock( const pub_key_vec_t& wr, const pub_key_vec_t& rd );

    void unlock( const pub_key_vec_t& wr, const pub_key_vec_t& rd );

    // number of accounts currently locked
    size_t size() const;

  private:
    bool can_lock( const pub_key_vec_t&, const pub_key_vec_t& ) const;
    void add_lock( const pub_key_vec_t&, const pub_key_vec_t& );

    // writers hold -1, readers hold the reader count
    typedef std::unordered_map<pub_key,int,hash_bucket> lock_map_t;
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    lock_map_t              lmap_;
  };

  // scoped hold on a set of account locks
  // contended acquisitions are logged before blocking
  class account_lock_guard
  {
  public:
    account_lock_guard( account_locks&,
                        const pub_key_vec_t& wr,
                        const pub_key_vec_t& rd );
    ~account_lock_guard();
  private:
    account_lock_guard( const account_lock_guard& );
    account_lock_guard& operator=( const account_lock_guard& );
    account_locks&       lk_;
    const pub_key_vec_t& wr_;
    const pub_key_vec_t& rd_;
  };

}
