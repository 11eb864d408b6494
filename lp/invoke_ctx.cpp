#include "invoke_ctx.hpp"
#include "tx.hpp"

using namespace lp;

program::~program()
{
}

acc_info::acc_info()
: is_signer_( false ),
  is_writable_( false ),
  acc_( nullptr ),
  sys_debit_( 0 )
{
}

invoke_ctx::invoke_ctx(
    const pub_key& prog_id, int64_t now, acc_info_vec_t& accv )
: prog_( prog_id ),
  now_( now ),
  accv_( accv )
{
}

err_code invoke_ctx::check_authority(
    const acc_info& acc, const seed_vec_t *seeds ) const
{
  if ( seeds ) {
    pub_key pda;
    if ( !pda.create_program_address( *seeds, prog_ ) || pda != acc.key_ ) {
      return e_invalid_seeds;
    }
    return e_success;
  }
  return acc.is_signer_ ? e_success : e_missing_signature;
}

static bool is_system_owned( const account& acc )
{
  return acc.owner_ == tx::get_system_id() && acc.data_.empty();
}

err_code invoke_ctx::create_account( acc_info& payer,
                                     acc_info& new_acc,
                                     uint64_t lamports,
                                     size_t space,
                                     const pub_key& owner,
                                     const seed_vec_t *seeds )
{
  if ( !payer.is_writable_ || !new_acc.is_writable_ ) {
    return e_readonly_modified;
  }
  if ( !payer.is_signer_ ) {
    return e_missing_signature;
  }
  err_code rc = check_authority( new_acc, seeds );
  if ( rc != e_success ) {
    return rc;
  }
  account& src = *payer.acc_;
  account& tgt = *new_acc.acc_;
  if ( !is_system_owned( tgt ) ) {
    return e_already_exists;
  }
  if ( !is_system_owned( src ) ) {
    return e_invalid_account_data;
  }
  if ( &src == &tgt ) {
    return e_account_mismatch;
  }

  // lamports already sent to the address count towards the balance
  uint64_t topup = tgt.lamports_ < lamports ? lamports - tgt.lamports_ : 0UL;
  if ( src.lamports_ < topup ) {
    return e_insufficient_funds;
  }
  src.lamports_ -= topup;
  payer.sys_debit_ += topup;
  tgt.lamports_ += topup;
  tgt.owner_ = owner;
  tgt.data_.assign( space, 0 );
  return e_success;
}

err_code invoke_ctx::transfer( acc_info& from,
                               acc_info& to,
                               uint64_t lamports,
                               const seed_vec_t *signer_seeds )
{
  if ( !from.is_writable_ || !to.is_writable_ ) {
    return e_readonly_modified;
  }
  err_code rc = check_authority( from, signer_seeds );
  if ( rc != e_success ) {
    return rc;
  }
  account& src = *from.acc_;
  account& tgt = *to.acc_;
  if ( !is_system_owned( src ) || !is_system_owned( tgt ) ) {
    return e_invalid_account_data;
  }
  if ( src.lamports_ < lamports ) {
    return e_insufficient_funds;
  }
  if ( &src == &tgt ) {
    return e_success;
  }
  if ( lamports > UINT64_MAX - tgt.lamports_ ) {
    return e_arithmetic_overflow;
  }
  src.lamports_ -= lamports;
  from.sys_debit_ += lamports;
  tgt.lamports_ += lamports;
  return e_success;
}
