#include "account_db.hpp"
#include <algorithm>

using namespace lp;

account::account()
: lamports_( 0 )
{
}

bool account::is_empty() const
{
  return lamports_ == 0 && data_.empty();
}

bool account::operator==( const account& obj ) const
{
  return owner_ == obj.owner_ &&
         lamports_ == obj.lamports_ &&
         data_ == obj.data_;
}

bool account::operator!=( const account& obj ) const
{
  return !(*this == obj );
}

bool account_db::get( const pub_key& key, account& acc ) const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  acc_map_t::const_iterator it = amap_.find( key );
  if ( it == amap_.end() ) {
    acc = account();
    return false;
  }
  acc = it->second;
  return true;
}

bool account_db::exists( const pub_key& key ) const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  return amap_.find( key ) != amap_.end();
}

uint64_t account_db::get_lamports( const pub_key& key ) const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  acc_map_t::const_iterator it = amap_.find( key );
  return it != amap_.end() ? it->second.lamports_ : 0UL;
}

void account_db::put( const pub_key& key, const account& acc )
{
  std::lock_guard<std::mutex> lck( mtx_ );
  if ( acc.is_empty() ) {
    amap_.erase( key );
  } else {
    amap_[key] = acc;
  }
}

bool account_db::add_lamports( const pub_key& key, uint64_t lamports )
{
  std::lock_guard<std::mutex> lck( mtx_ );
  account& acc = amap_[key];
  if ( lamports > UINT64_MAX - acc.lamports_ ) {
    if ( acc.is_empty() ) {
      amap_.erase( key );
    }
    return set_err_code( e_arithmetic_overflow );
  }
  acc.lamports_ += lamports;
  if ( acc.is_empty() ) {
    amap_.erase( key );
  }
  return true;
}

static bool key_less( const key_account_t& a, const key_account_t& b )
{
  return a.first < b.first;
}

void account_db::get_program_accounts(
    const pub_key& owner, key_account_vec_t& res ) const
{
  res.clear();
  {
    std::lock_guard<std::mutex> lck( mtx_ );
    for( const acc_map_t::value_type& it: amap_ ) {
      if ( it.second.owner_ == owner ) {
        res.push_back( key_account_t( it.first, it.second ) );
      }
    }
  }
  std::sort( res.begin(), res.end(), key_less );
}

size_t account_db::size() const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  return amap_.size();
}

void account_db::clear()
{
  std::lock_guard<std::mutex> lck( mtx_ );
  amap_.clear();
}

// section layout: u64 count then per account
// key, owner, u64 lamports, u32 data length, data
bool account_db::save( snapshot& snp )
{
  key_account_vec_t accv;
  {
    std::lock_guard<std::mutex> lck( mtx_ );
    accv.reserve( amap_.size() );
    for( const acc_map_t::value_type& it: amap_ ) {
      accv.push_back( key_account_t( it.first, it.second ) );
    }
  }
  std::sort( accv.begin(), accv.end(), key_less );
  char hdr[2*pub_key::len + 3*sizeof(uint64_t)];
  bincode cnt( hdr, sizeof( hdr ) );
  cnt.add( (uint64_t)accv.size() );
  if ( !snp.write( hdr, cnt.size() ) ) {
    return set_err_msg( snp.get_err_msg() );
  }
  for( const key_account_t& ka: accv ) {
    const account& acc = ka.second;
    bincode wtr( hdr, sizeof( hdr ) );
    wtr.add( ka.first );
    wtr.add( acc.owner_ );
    wtr.add( acc.lamports_ );
    wtr.add( (uint32_t)acc.data_.size() );
    if ( !snp.write( hdr, wtr.size() ) ||
         !snp.write( (const char*)acc.data_.data(), acc.data_.size() ) ) {
      return set_err_msg( snp.get_err_msg() );
    }
  }
  return true;
}

bool account_db::load( bindec& rdr )
{
  acc_map_t amap;
  uint64_t num = 0;
  if ( !rdr.get( num ) ) {
    return set_err_msg( "truncated snapshot account section" );
  }
  for( uint64_t i=0; i != num; ++i ) {
    pub_key key;
    account acc;
    uint32_t dlen = 0;
    const char *dptr = nullptr;
    if ( !rdr.get( key ) ||
         !rdr.get( acc.owner_ ) ||
         !rdr.get( acc.lamports_ ) ||
         !rdr.get( dlen ) ||
         !rdr.get_ref( dptr, dlen ) ) {
      return set_err_msg( "truncated snapshot account section" );
    }
    acc.data_.assign( (const uint8_t*)dptr, (const uint8_t*)dptr + dlen );
    if ( !acc.is_empty() ) {
      amap[key] = acc;
    }
  }
  std::lock_guard<std::mutex> lck( mtx_ );
  amap_.swap( amap );
  return true;
}
