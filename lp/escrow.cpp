#include "escrow.hpp"
#include "tx.hpp"

using namespace lp;

release_cap::release_cap()
{
}

// seeds reproducing the escrow address from the stored bump
static err_code escrow_seeds( invoke_ctx& ctx,
                              const pub_key& job_key,
                              const job_post& job,
                              const acc_info& esc,
                              pda_seeds& seeds )
{
  seeds.init_escrow( job_key );
  pub_key addr;
  if ( !seeds.create( ctx.get_program_id(), job.escrow_bump_, addr ) ||
       addr != esc.key_ ) {
    return e_account_mismatch;
  }
  return e_success;
}

err_code escrow::derive( const pub_key& prog,
                         const pub_key& job,
                         pub_key& addr,
                         uint8_t& bump )
{
  pda_seeds seeds;
  seeds.init_escrow( job );
  if ( !seeds.find( prog, addr ) ) {
    return e_invalid_seeds;
  }
  bump = seeds.get_bump();
  return e_success;
}

err_code escrow::deposit( invoke_ctx& ctx,
                          const pub_key& job_key,
                          acc_info& client,
                          acc_info& esc,
                          const job_post& job )
{
  pda_seeds seeds;
  err_code rc = escrow_seeds( ctx, job_key, job, esc, seeds );
  if ( rc != e_success ) {
    return rc;
  }
  const account& acc = *esc.acc_;
  if ( acc.owner_ != tx::get_system_id() || !acc.data_.empty() ) {
    return e_already_exists;
  }
  if ( acc.lamports_ ) {
    rc = ctx.transfer( esc, client, acc.lamports_, &seeds.get_seeds() );
    if ( rc != e_success ) {
      return rc;
    }
  }
  return ctx.create_account( client, esc, job.amount_, 0,
                             ctx.get_program_id(), &seeds.get_seeds() );
}

err_code escrow::check( invoke_ctx& ctx,
                        const pub_key& job_key,
                        const job_post& job,
                        const acc_info& esc )
{
  pda_seeds seeds;
  err_code rc = escrow_seeds( ctx, job_key, job, esc, seeds );
  if ( rc != e_success ) {
    return rc;
  }
  const account& acc = *esc.acc_;
  if ( acc.owner_ != ctx.get_program_id() ||
       !acc.data_.empty() ||
       acc.lamports_ != job.amount_ ) {
    return e_escrow_mismatch;
  }
  return e_success;
}

err_code escrow::release( const release_cap&,
                          invoke_ctx& ctx,
                          const pub_key& job_key,
                          const job_post& job,
                          acc_info& esc,
                          acc_info& freelancer )
{
  err_code rc = check( ctx, job_key, job, esc );
  if ( rc != e_success ) {
    return rc;
  }
  if ( !esc.is_writable_ || !freelancer.is_writable_ ) {
    return e_readonly_modified;
  }
  account& src = *esc.acc_;
  account& tgt = *freelancer.acc_;
  if ( &src == &tgt ) {
    return e_account_mismatch;
  }
  if ( src.lamports_ > UINT64_MAX - tgt.lamports_ ) {
    return e_arithmetic_overflow;
  }
  tgt.lamports_ += src.lamports_;
  src.lamports_ = 0;
  return e_success;
}
