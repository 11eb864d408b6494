#include "bank.hpp"
#include "invoke_ctx.hpp"
#include "digest.hpp"
#include "log.hpp"

using namespace lp;

static const char snapshot_magic[] = "lpledger";
static const uint32_t snapshot_version = 1;

size_t sig_bucket::operator()( const signature& sig ) const
{
  size_t res;
  __builtin_memcpy( &res, sig.data(), sizeof( res ) );
  return res;
}

// zeroed space handed from a system account to a new owner
static bool is_allocation( const account& pre, const account& post )
{
  if ( pre.owner_ != tx::get_system_id() || !pre.data_.empty() ) {
    return false;
  }
  for( uint8_t val: post.data_ ) {
    if ( val ) {
      return false;
    }
  }
  return true;
}

bank::bank()
: num_tx_( 0 ),
  clock_( 0 )
{
  hash genesis;
  sha256 sh;
  sh.add( str( "lp genesis" ) );
  sh.fin( genesis );
  hq_.push_back( hash_sigs_t( genesis, sig_vec_t() ) );
  add_program( &sys_ );
}

void bank::add_program( program *prog )
{
  pmap_[prog->get_id()] = prog;
}

program *bank::get_program( const pub_key& id ) const
{
  prog_map_t::const_iterator it = pmap_.find( id );
  return it != pmap_.end() ? it->second : nullptr;
}

void bank::set_clock( int64_t ts )
{
  std::lock_guard<std::mutex> lck( mtx_ );
  clock_ = ts;
}

int64_t bank::get_clock() const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  if ( clock_ ) {
    return clock_;
  }
  return get_now() / LP_NSECS_IN_SEC;
}

hash bank::get_recent_hash() const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  return hq_.back().first;
}

uint64_t bank::get_num_tx() const
{
  std::lock_guard<std::mutex> lck( mtx_ );
  return num_tx_;
}

bool bank::airdrop( const pub_key& key, uint64_t lamports )
{
  account acc;
  if ( adb_.get( key, acc ) && acc.owner_ != tx::get_system_id() ) {
    return set_err_msg( "airdrop target not a system account" );
  }
  if ( !adb_.add_lamports( key, lamports ) ) {
    return set_err_msg( adb_.get_err_msg() );
  }
  LP_LOG_INF( "airdrop" )
    .add( "account", key )
    .add( "lamports", lamports )
    .end();
  return true;
}

err_code bank::check_recent( const tx_msg& msg )
{
  const signature& sig = msg.get_signature( 0 );
  std::lock_guard<std::mutex> lck( mtx_ );
  hash_queue_t::iterator it = hq_.begin();
  for( ; it != hq_.end(); ++it ) {
    if ( it->first == msg.get_recent_hash() ) {
      break;
    }
  }
  if ( it == hq_.end() ) {
    return e_block_hash_not_found;
  }
  if ( !sigs_.insert( sig ).second ) {
    return e_already_processed;
  }
  it->second.push_back( sig );
  return e_success;
}

void bank::release_sig( const tx_msg& msg )
{
  const signature& sig = msg.get_signature( 0 );
  std::lock_guard<std::mutex> lck( mtx_ );
  sigs_.erase( sig );
  for( hash_sigs_t& ent: hq_ ) {
    if ( ent.first == msg.get_recent_hash() ) {
      sig_vec_t& sv = ent.second;
      for( sig_vec_t::iterator it = sv.begin(); it != sv.end(); ++it ) {
        if ( *it == sig ) {
          sv.erase( it );
          break;
        }
      }
      break;
    }
  }
}

void bank::commit_hash( const tx_msg& msg )
{
  std::lock_guard<std::mutex> lck( mtx_ );
  sha256 sh;
  sh.add( hq_.back().first.data(), hash::len );
  sh.add( msg.get_signature( 0 ).data(), signature::len );
  hash nhash;
  sh.fin( nhash );
  hq_.push_back( hash_sigs_t( nhash, sig_vec_t() ) );
  while( hq_.size() > max_recent_hashes ) {
    for( const signature& sig: hq_.front().second ) {
      sigs_.erase( sig );
    }
    hq_.pop_front();
  }
  ++num_tx_;
}

err_code bank::run_instr( const tx_msg& msg,
                          const tx_msg::instr& ins,
                          std::vector<account>& accv,
                          int64_t now )
{
  const pub_key& pid = msg.get_key( ins.prog_idx_ );
  program *prog = get_program( pid );
  if ( !prog ) {
    return e_unknown_program;
  }
  acc_info_vec_t infov( ins.num_accs_ );
  for( unsigned i=0; i != ins.num_accs_; ++i ) {
    unsigned idx = ins.acc_idx_[i];
    acc_info& info = infov[i];
    info.key_ = msg.get_key( idx );
    info.is_signer_ = msg.is_signer( idx );
    info.is_writable_ = msg.is_writable( idx );
    info.acc_ = &accv[idx];
  }

  // run program against working copies
  std::vector<account> prev( accv );
  invoke_ctx ctx( pid, now, infov );
  err_code rc = prog->process( ctx, ins.data_, ins.data_len_ );
  if ( rc != e_success ) {
    return rc;
  }

  // enforce runtime rules on every account of the transaction
  std::vector<uint64_t> sys_debit( accv.size(), 0UL );
  for( unsigned i=0; i != ins.num_accs_; ++i ) {
    sys_debit[ins.acc_idx_[i]] += infov[i].sys_debit_;
  }
  unsigned __int128 pre_sum = 0, post_sum = 0;
  for( unsigned i=0; i != accv.size(); ++i ) {
    const account& pre = prev[i];
    const account& post = accv[i];
    pre_sum += pre.lamports_;
    post_sum += post.lamports_;
    if ( pre == post ) {
      continue;
    }
    if ( !msg.is_writable( i ) ) {
      return e_readonly_modified;
    }
    if ( pre.owner_ != post.owner_ &&
         ( pre.owner_ != tx::get_system_id() || !pre.data_.empty() ) ) {
      return e_external_data_modified;
    }
    if ( pre.data_ != post.data_ && post.owner_ != pid &&
         !is_allocation( pre, post ) ) {
      return e_external_data_modified;
    }
    if ( post.lamports_ < pre.lamports_ && pre.owner_ != pid &&
         pre.lamports_ - post.lamports_ > sys_debit[i] ) {
      return e_external_data_modified;
    }
    if ( post.lamports_ > pre.lamports_ &&
         pre.owner_ != tx::get_system_id() && pre.owner_ != pid ) {
      return e_external_data_modified;
    }
  }
  if ( pre_sum != post_sum ) {
    return e_unbalanced_instruction;
  }
  return e_success;
}

err_code bank::execute( const tx_msg& msg, int64_t now )
{
  pub_key_vec_t wr, rd;
  for( unsigned i=0; i != msg.get_num_keys(); ++i ) {
    if ( msg.is_writable( i ) ) {
      wr.push_back( msg.get_key( i ) );
    } else {
      rd.push_back( msg.get_key( i ) );
    }
  }

  // hold all account locks until commit
  account_lock_guard guard( locks_, wr, rd );
  std::vector<account> accv( msg.get_num_keys() );
  for( unsigned i=0; i != msg.get_num_keys(); ++i ) {
    adb_.get( msg.get_key( i ), accv[i] );
  }
  for( unsigned i=0; i != msg.get_num_instrs(); ++i ) {
    err_code rc = run_instr( msg, msg.get_instr( i ), accv, now );
    if ( rc != e_success ) {
      return rc;
    }
  }
  for( unsigned i=0; i != msg.get_num_keys(); ++i ) {
    if ( msg.is_writable( i ) ) {
      adb_.put( msg.get_key( i ), accv[i] );
    }
  }
  return e_success;
}

err_code bank::process( const char *buf, size_t len )
{
  tx_msg msg;
  err_code rc = msg.parse( buf, len );
  if ( rc == e_success ) {
    rc = msg.verify();
  }
  if ( rc == e_success ) {
    rc = check_recent( msg );
  }
  if ( rc != e_success ) {
    LP_LOG_WRN( "rejected transaction" )
      .add( "len", (uint64_t)len )
      .add( "status", rc )
      .end();
    return rc;
  }
  rc = execute( msg, get_clock() );
  if ( rc == e_success ) {
    commit_hash( msg );
  } else {
    release_sig( msg );
  }
  LP_LOG_INF( "processed transaction" )
    .add( "sig", msg.get_signature( 0 ) )
    .add( "num_instr", msg.get_num_instrs() )
    .add( "status", rc )
    .end();
  return rc;
}

bool bank::save( const std::string& file )
{
  snapshot snp;
  snp.set_file( file );
  if ( !snp.init_write() ) {
    return set_err_msg( snp.get_err_msg() );
  }

  // header and recent hash queue
  {
    std::lock_guard<std::mutex> lck( mtx_ );
    char buf[128];
    bincode wtr( buf, sizeof( buf ) );
    wtr.add( snapshot_magic, 8 );
    wtr.add( snapshot_version );
    wtr.add( num_tx_ );
    wtr.add( (uint32_t)hq_.size() );
    if ( !snp.write( buf, wtr.size() ) ) {
      return set_err_msg( snp.get_err_msg() );
    }
    for( const hash_sigs_t& ent: hq_ ) {
      wtr.reset_pos();
      wtr.add( ent.first );
      wtr.add( (uint32_t)ent.second.size() );
      if ( !snp.write( buf, wtr.size() ) ) {
        return set_err_msg( snp.get_err_msg() );
      }
      for( const signature& sig: ent.second ) {
        if ( !snp.write( (const char*)sig.data(), signature::len ) ) {
          return set_err_msg( snp.get_err_msg() );
        }
      }
    }
  }

  // accounts
  if ( !adb_.save( snp ) ) {
    return set_err_msg( adb_.get_err_msg() );
  }
  if ( !snp.commit() ) {
    return set_err_msg( snp.get_err_msg() );
  }
  LP_LOG_DBG( "saved snapshot" )
    .add( "file", file )
    .add( "num_accounts", (uint64_t)adb_.size() )
    .end();
  return true;
}

bool bank::load( const std::string& file )
{
  snapshot snp;
  snp.set_file( file );
  std::string buf;
  if ( !snp.read( buf ) ) {
    return set_err_msg( snp.get_err_msg() );
  }
  bindec rdr( buf.c_str(), buf.length() );
  const char *magic;
  uint32_t version = 0, num_hash = 0;
  uint64_t num_tx = 0;
  if ( !rdr.get_ref( magic, 8 ) ||
       0 != __builtin_memcmp( magic, snapshot_magic, 8 ) ||
       !rdr.get( version ) ) {
    return set_err_msg( "not a ledger snapshot file=" + file );
  }
  if ( version != snapshot_version ) {
    return set_err_msg( "unsupported snapshot version file=" + file );
  }
  if ( !rdr.get( num_tx ) ||
       !rdr.get( num_hash ) ||
       num_hash == 0 || num_hash > max_recent_hashes ) {
    return set_err_msg( "corrupt snapshot header file=" + file );
  }
  hash_queue_t hq;
  sig_set_t sigs;
  for( uint32_t i=0; i != num_hash; ++i ) {
    hash_sigs_t ent;
    uint32_t num_sig = 0;
    if ( !rdr.get( ent.first ) || !rdr.get( num_sig ) ) {
      return set_err_msg( "corrupt snapshot header file=" + file );
    }
    for( uint32_t j=0; j != num_sig; ++j ) {
      const char *sptr;
      if ( !rdr.get_ref( sptr, signature::len ) ) {
        return set_err_msg( "corrupt snapshot header file=" + file );
      }
      signature sig;
      sig.init_from_buf( (const uint8_t*)sptr );
      ent.second.push_back( sig );
      sigs.insert( sig );
    }
    hq.push_back( ent );
  }
  if ( !adb_.load( rdr ) ) {
    return set_err_msg( adb_.get_err_msg() + " file=" + file );
  }
  if ( rdr.get_left() ) {
    return set_err_msg( "trailing bytes in snapshot file=" + file );
  }
  {
    std::lock_guard<std::mutex> lck( mtx_ );
    hq_.swap( hq );
    sigs_.swap( sigs );
    num_tx_ = num_tx;
  }
  LP_LOG_DBG( "loaded snapshot" )
    .add( "file", file )
    .add( "num_accounts", (uint64_t)adb_.size() )
    .end();
  return true;
}
