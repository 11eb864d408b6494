#include "account_locks.hpp"
#include "log.hpp"

using namespace lp;

bool account_locks::can_lock(
    const pub_key_vec_t& wr, const pub_key_vec_t& rd ) const
{
  for( const pub_key& key: wr ) {
    if ( lmap_.find( key ) != lmap_.end() ) {
      return false;
    }
  }
  for( const pub_key& key: rd ) {
    lock_map_t::const_iterator it = lmap_.find( key );
    if ( it != lmap_.end() && it->second < 0 ) {
      return false;
    }
  }
  return true;
}

void account_locks::add_lock(
    const pub_key_vec_t& wr, const pub_key_vec_t& rd )
{
  for( const pub_key& key: wr ) {
    lmap_[key] = -1;
  }
  for( const pub_key& key: rd ) {
    ++lmap_[key];
  }
}

void account_locks::lock( const pub_key_vec_t& wr, const pub_key_vec_t& rd )
{
  std::unique_lock<std::mutex> lck( mtx_ );
  while( !can_lock( wr, rd ) ) {
    cv_.wait( lck );
  }
  add_lock( wr, rd );
}

bool account_locks::try_lock(
    const pub_key_vec_t& wr, const pub_key_vec_t& rd )
{
  std::lock_guard<std::mutex> lck( mtx_ );
  if ( !can_lock( wr, rd ) ) {
    return false;
  }
  add_lock( wr, rd );
  return true;
}

void account_locks::unlock(
    const pub_key_vec_t& wr, const pub_key_vec_t& rd )
{
  {
    std::lock_guard<std::mutex> lck( mtx_ );
    for( const pub_key& key: wr ) {
      lmap_.erase( key );
    }
    for( const pub_key& key: rd ) {
      lock_map_t::iterator it = lmap_.find( key );
      if ( it != lmap_.end() && --it->second <= 0 ) {
        lmap_.erase( it );
      }
    }
  }
  cv_.notify_all();
}

size_t account_locks::size() const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  return lmap_.size();
}

account_lock_guard::account_lock_guard(
    account_locks& lk, const pub_key_vec_t& wr, const pub_key_vec_t& rd )
: lk_( lk ), wr_( wr ), rd_( rd )
{
  if ( lk_.try_lock( wr_, rd_ ) ) {
    return;
  }
  LP_LOG_DBG( "waiting on account locks" )
    .add( "num_write", (uint64_t)wr_.size() )
    .add( "num_read", (uint64_t)rd_.size() )
    .end();
  lk_.lock( wr_, rd_ );
}

account_lock_guard::~account_lock_guard()
{
  lk_.unlock( wr_, rd_ );
}
