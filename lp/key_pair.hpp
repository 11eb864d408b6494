#pragma once

#include <lp/misc.hpp>
#include <vector>

namespace lp
{

  class key_pair;

  class hash
  {
  public:
    static const size_t len = 32;
    hash();  // zero
    hash( const hash& );
    hash& operator=( const hash& );
    bool operator==( const hash& )const;
    bool operator!=( const hash& )const;
    bool operator<( const hash& )const;
    void zero();
    bool is_zero() const;

    // initialize from base58 encoded text
    bool init_from_text( str buf );
    void init_from_buf( const uint8_t * );

    // encode to text buffer
    int enc_base58( char *buf, int buflen ) const;
    int enc_base58( std::string& ) const;
    std::string as_string() const;

    // get underlying bytes
    const uint8_t *data() const;

    // bucket value for hashed containers
    size_t get_bucket() const;

  protected:
    union{ uint64_t i_[4]; uint8_t pk_[len]; };
  };

  // hash functor for std::unordered_map keyed by hash or pub_key
  struct hash_bucket
  {
    size_t operator()( const hash& h ) const { return h.get_bucket(); }
  };

  // program-derived address seeds
  typedef std::vector<str> seed_vec_t;

  // public key
  class pub_key : public hash
  {
  public:
    static const size_t max_seeds    = 16;
    static const size_t max_seed_len = 32;

    pub_key();
    pub_key( const pub_key& );
    pub_key( const key_pair& );
    pub_key& operator=( const pub_key& );

    // is key a valid compressed ed25519 curve point
    bool is_on_curve() const;

    // derive address from seeds and program id
    // fails if seeds exceed limits or result lies on the curve
    bool create_program_address( const seed_vec_t&, const pub_key& prog );

    // search bump seeds 255 down to 0 for first valid derived address
    bool find_program_address( const seed_vec_t&,
                               const pub_key& prog,
                               uint8_t& bump );
  };

  // private/public key pair
  class key_pair
  {
  public:
    static const size_t len = 64;

    void zero();

    // generate new keypair
    bool gen();

    // initialize from json-format key file used by solana
    bool init_from_file( const std::string& file );
    bool init_from_json( const char *buf, size_t len );
    bool init_from_json( const std::string& buf );

    // encode as json byte array
    void enc_json( std::string& ) const;

    // get public key part of pair
    void get_pub_key( pub_key& ) const;

    // get underlying bytes
    const uint8_t *data() const;

  private:
    uint8_t pk_[len];
  };

  // digital signature
  class signature
  {
  public:

    static const size_t len = 64;

    bool operator==( const signature& ) const;

    // initialize from raw bytes or bas58 encoded text
    void init_from_buf( const uint8_t * );
    bool init_from_text( str buf );

    // encode to text buffer
    int enc_base58( char *buf, int buflen ) const;
    int enc_base58( std::string& ) const;

    // sign message given key_pair
    bool sign( const uint8_t* msg, size_t msg_len,
               const key_pair& );

    // verify message given public key
    bool verify( const uint8_t* msg, size_t msg_len,
                 const pub_key& ) const;

    // get underlying bytes
    const uint8_t *data() const;

  private:
    uint8_t sig_[len];
  };

  inline const uint8_t *hash::data() const
  {
    return pk_;
  }

  inline size_t hash::get_bucket() const
  {
    return (size_t)i_[0];
  }

  inline const uint8_t *key_pair::data() const
  {
    return pk_;
  }

  inline const uint8_t *signature::data() const
  {
    return sig_;
  }

}
