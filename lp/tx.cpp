#include "tx.hpp"

using namespace lp;

acc_meta::acc_meta()
: is_signer_( false ),
  is_writable_( false )
{
}

acc_meta::acc_meta( const pub_key& key, bool is_signer, bool is_writable )
: key_( key ),
  is_signer_( is_signer ),
  is_writable_( is_writable )
{
}

void instruction::add_account(
    const pub_key& key, bool is_signer, bool is_writable )
{
  accs_.push_back( acc_meta( key, is_signer, is_writable ) );
}

void instruction::set_data( const bincode& wtr )
{
  data_.assign( wtr.get_buf(), wtr.get_buf() + wtr.size() );
}

const pub_key& tx::get_system_id()
{
  static const pub_key sys_id;
  return sys_id;
}

void tx::transfer( instruction& ins,
                   const pub_key& sender,
                   const pub_key& receiver,
                   uint64_t lamports )
{
  char buf[16];
  bincode wtr( buf, sizeof( buf ) );
  wtr.add( (uint32_t)e_transfer );
  wtr.add( lamports );
  ins.prog_ = get_system_id();
  ins.accs_.clear();
  ins.add_account( sender, true, true );
  ins.add_account( receiver, false, true );
  ins.set_data( wtr );
}

namespace
{
  struct key_ent
  {
    pub_key         key_;
    bool            is_signer_;
    bool            is_writable_;
    const key_pair *kp_;
  };

  typedef std::vector<key_ent> key_ent_vec_t;

  key_ent& find_or_add( key_ent_vec_t& kv, const pub_key& key )
  {
    for( key_ent& ent: kv ) {
      if ( ent.key_ == key ) {
        return ent;
      }
    }
    kv.resize( kv.size() + 1 );
    key_ent& ent = kv.back();
    ent.key_ = key;
    ent.is_signer_ = false;
    ent.is_writable_ = false;
    ent.kp_ = nullptr;
    return ent;
  }

  unsigned find_idx( const key_ent_vec_t& kv, const pub_key& key )
  {
    unsigned idx = 0;
    for( const key_ent& ent: kv ) {
      if ( ent.key_ == key ) {
        break;
      }
      ++idx;
    }
    return idx;
  }
}

bool tx::build( bincode& tx,
                const hash& recent_hash,
                const instruction_vec_t& insv,
                const signer_vec_t& sigv )
{
  if ( sigv.empty() ) {
    return false;
  }

  // collect unique accounts with merged permissions
  key_ent_vec_t kv;
  for( const key_pair *kp: sigv ) {
    key_ent& ent = find_or_add( kv, pub_key( *kp ) );
    ent.is_signer_ = true;
    ent.kp_ = kp;
  }
  kv[0].is_writable_ = true;
  for( const instruction& ins: insv ) {
    for( const acc_meta& acc: ins.accs_ ) {
      key_ent& ent = find_or_add( kv, acc.key_ );
      ent.is_signer_ |= acc.is_signer_;
      ent.is_writable_ |= acc.is_writable_;
    }
    find_or_add( kv, ins.prog_ );
  }

  // order: writable signers (payer first), read-only signers,
  // writable non-signers, read-only non-signers
  key_ent_vec_t ord;
  unsigned num_sig = 0, num_ro_signed = 0, num_ro_unsigned = 0;
  for( unsigned grp = 0; grp != 4; ++grp ) {
    bool is_signer = grp < 2;
    bool is_writable = ( grp % 2 ) == 0;
    for( const key_ent& ent: kv ) {
      if ( ent.is_signer_ == is_signer && ent.is_writable_ == is_writable ) {
        if ( is_signer && !ent.kp_ ) {
          return false;
        }
        ord.push_back( ent );
        num_sig += is_signer;
        num_ro_signed += is_signer && !is_writable;
        num_ro_unsigned += !is_signer && !is_writable;
      }
    }
  }
  if ( ord.size() > 256 ) {
    return false;
  }

  // signatures section
  std::vector<size_t> sig_idx;
  tx.add_len( num_sig );
  for( unsigned i=0; i != num_sig; ++i ) {
    sig_idx.push_back( tx.reserve_sign() );
  }

  // message header
  size_t tx_idx = tx.get_pos();
  tx.add( (uint8_t)num_sig );
  tx.add( (uint8_t)num_ro_signed );
  tx.add( (uint8_t)num_ro_unsigned );

  // accounts
  tx.add_len( ord.size() );
  for( const key_ent& ent: ord ) {
    tx.add( ent.key_ );
  }

  // recent block hash
  tx.add( recent_hash );

  // instructions section
  tx.add_len( insv.size() );
  for( const instruction& ins: insv ) {
    tx.add( (uint8_t)find_idx( ord, ins.prog_ ) );
    tx.add_len( ins.accs_.size() );
    for( const acc_meta& acc: ins.accs_ ) {
      tx.add( (uint8_t)find_idx( ord, acc.key_ ) );
    }
    tx.add_len( ins.data_.size() );
    tx.add( ins.data_.data(), ins.data_.size() );
  }
  if ( tx.get_is_overflow() || tx.size() > max_len ) {
    return false;
  }

  // every signer signs the message
  for( unsigned i=0; i != num_sig; ++i ) {
    if ( !tx.sign( sig_idx[i], tx_idx, *ord[i].kp_ ) ) {
      return false;
    }
  }
  return true;
}

err_code tx_msg::parse( const char *buf, size_t len )
{
  sigv_.clear();
  keyv_.clear();
  insv_.clear();
  msg_ = nullptr;
  msg_len_ = 0;
  num_req_sigs_ = num_ro_signed_ = num_ro_unsigned_ = 0;
  if ( len > tx::max_len ) {
    return e_invalid_transaction;
  }
  bindec rdr( buf, len );

  // signatures
  unsigned num_sig = 0;
  if ( !rdr.get_len( num_sig ) || num_sig == 0 ) {
    return e_invalid_transaction;
  }
  for( unsigned i=0; i != num_sig; ++i ) {
    const char *sptr;
    if ( !rdr.get_ref( sptr, signature::len ) ) {
      return e_invalid_transaction;
    }
    sigv_.resize( i + 1 );
    sigv_.back().init_from_buf( (const uint8_t*)sptr );
  }

  // header
  msg_ = (const uint8_t*)&buf[rdr.get_pos()];
  msg_len_ = rdr.get_left();
  if ( !rdr.get( num_req_sigs_ ) ||
       !rdr.get( num_ro_signed_ ) ||
       !rdr.get( num_ro_unsigned_ ) ||
       num_req_sigs_ != num_sig ||
       num_ro_signed_ >= num_req_sigs_ ) {
    return e_invalid_transaction;
  }

  // account keys
  unsigned num_keys = 0;
  if ( !rdr.get_len( num_keys ) ||
       num_keys > 256 ||
       num_keys < (unsigned)num_req_sigs_ + num_ro_unsigned_ ) {
    return e_invalid_transaction;
  }
  keyv_.resize( num_keys );
  for( unsigned i=0; i != num_keys; ++i ) {
    if ( !rdr.get( keyv_[i] ) ) {
      return e_invalid_transaction;
    }
    for( unsigned j=0; j != i; ++j ) {
      if ( keyv_[j] == keyv_[i] ) {
        return e_invalid_transaction;
      }
    }
  }
  if ( !rdr.get( rhash_ ) ) {
    return e_invalid_transaction;
  }

  // instructions
  unsigned num_instr = 0;
  if ( !rdr.get_len( num_instr ) ) {
    return e_invalid_transaction;
  }
  insv_.resize( num_instr );
  for( instr& ins: insv_ ) {
    const char *ptr;
    if ( !rdr.get( ins.prog_idx_ ) ||
         ins.prog_idx_ >= num_keys ||
         !rdr.get_len( ins.num_accs_ ) ||
         !rdr.get_ref( ptr, ins.num_accs_ ) ) {
      return e_invalid_transaction;
    }
    ins.acc_idx_ = (const uint8_t*)ptr;
    for( unsigned i=0; i != ins.num_accs_; ++i ) {
      if ( ins.acc_idx_[i] >= num_keys ) {
        return e_invalid_transaction;
      }
    }
    unsigned dlen = 0;
    if ( !rdr.get_len( dlen ) || !rdr.get_ref( ptr, dlen ) ) {
      return e_invalid_transaction;
    }
    ins.data_len_ = dlen;
    ins.data_ = (const uint8_t*)ptr;
  }
  if ( rdr.get_left() ) {
    return e_invalid_transaction;
  }
  return e_success;
}

err_code tx_msg::verify() const
{
  static const uint8_t zero_sig[signature::len] = { 0 };
  for( unsigned i=0; i != sigv_.size(); ++i ) {
    const signature& sig = sigv_[i];
    if ( 0 == __builtin_memcmp( sig.data(), zero_sig, signature::len ) ) {
      return e_missing_signature;
    }
    if ( !sig.verify( msg_, msg_len_, keyv_[i] ) ) {
      return e_invalid_signature;
    }
  }
  return e_success;
}
