#pragma once

#include <lp/key_pair.hpp>
#include <lp/error.hpp>

namespace lp
{

  // directory of named wallet key pairs
  class key_store : public error
  {
  public:

    // create/chmod key_store directory
    bool create();

    // initialize
    bool init();

    // directory where to store account keys
    void set_dir( const std::string& dir_name );
    std::string get_dir() const;

    // file name for named key pair
    std::string get_key_pair_file( const std::string& name ) const;

    // generate new named key pair, fails if one already exists
    bool create_key_pair( const std::string& name, key_pair& );

    // load named key pair
    bool get_key_pair( const std::string& name, key_pair& );

  private:
    bool is_valid_name( const std::string& );
    std::string dir_;  // key store directory
  };

}
