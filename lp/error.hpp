#pragma once

#include <lp/misc.hpp>
#include <string>
#include <string.h>

namespace lp
{

  // outcome of a transaction, instruction or program operation
  enum err_code
  {
    e_success = 0,

    // authorization
    e_unauthorized,
    e_missing_signature,
    e_invalid_signature,

    // state
    e_job_already_filled,
    e_application_not_approved,
    e_work_not_completed,
    e_already_paid,

    // validation
    e_invalid_dates,
    e_invalid_amount,
    e_field_too_long,
    e_account_mismatch,
    e_invalid_account_data,
    e_invalid_instruction,
    e_invalid_seeds,
    e_invalid_transaction,

    // resource
    e_insufficient_funds,
    e_escrow_mismatch,
    e_arithmetic_overflow,

    // uniqueness
    e_already_exists,
    e_already_processed,

    // runtime
    e_unknown_program,
    e_block_hash_not_found,
    e_readonly_modified,
    e_external_data_modified,
    e_unbalanced_instruction,

    e_last_err_code
  };

  str err_code_to_str( err_code );

  // container for general errors
  class error
  {
  public:
    error();
    void reset_err();
    bool get_is_err() const;
    bool set_err_msg( const std::string& );
    bool set_err_msg( const std::string&, int errcode );
    bool set_err_code( err_code );
    bool set_err_code( const std::string&, err_code );
    err_code get_err_code() const;
    std::string get_err_msg() const;
  private:
    bool        is_err_;
    err_code    code_;
    std::string err_msg_;
  };

  inline error::error()
  : is_err_( false ),
    code_( e_success )
  {
  }

  inline void error::reset_err()
  {
    is_err_ = false;
    code_ = e_success;
    err_msg_.clear();
  }

  inline bool error::get_is_err() const
  {
    return is_err_;
  }

  inline bool error::set_err_msg( const std::string& err_msg )
  {
    err_msg_ = err_msg;
    is_err_ = true;
    return false;
  }

  inline bool error::set_err_msg( const std::string& err_msg, int errcode )
  {
    err_msg_ = err_msg;
    err_msg_ += " [";
    err_msg_ += std::to_string( errcode );
    err_msg_ += ' ';
    err_msg_ += strerror( errcode);
    err_msg_ += ']';
    is_err_ = true;
    return false;
  }

  inline bool error::set_err_code( err_code code )
  {
    code_ = code;
    return set_err_msg( err_code_to_str( code ).as_string() );
  }

  inline bool error::set_err_code( const std::string& err_msg, err_code code )
  {
    code_ = code;
    return set_err_msg(
        err_msg + " [" + err_code_to_str( code ).as_string() + "]" );
  }

  inline err_code error::get_err_code() const
  {
    return code_;
  }

  inline std::string error::get_err_msg() const
  {
    return err_msg_;
  }

}
