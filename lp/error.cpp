#include "error.hpp"

namespace lp
{

  static const char *err_code_str[] = {
    "Success",
    "Unauthorized",
    "MissingSignature",
    "InvalidSignature",
    "JobAlreadyFilled",
    "ApplicationNotApproved",
    "WorkNotCompleted",
    "AlreadyPaid",
    "InvalidDates",
    "InvalidAmount",
    "FieldTooLong",
    "AccountMismatch",
    "InvalidAccountData",
    "InvalidInstruction",
    "InvalidSeeds",
    "InvalidTransaction",
    "InsufficientFunds",
    "EscrowMismatch",
    "ArithmeticOverflow",
    "AlreadyExists",
    "AlreadyProcessed",
    "UnknownProgram",
    "BlockHashNotFound",
    "ReadonlyModified",
    "ExternalDataModified",
    "UnbalancedInstruction"
  };

  static_assert( sizeof( err_code_str ) / sizeof( err_code_str[0] ) ==
                 (size_t)e_last_err_code, "err_code_str out of sync" );

  str err_code_to_str( err_code code )
  {
    unsigned ic = (unsigned)code;
    if ( ic >= (unsigned)e_last_err_code ) {
      return "Unknown";
    }
    return err_code_str[ic];
  }

}
