#pragma once

#include <lp/bincode.hpp>
#include <lp/key_pair.hpp>
#include <lp/error.hpp>
#include <vector>

namespace lp
{

  // account referenced by an instruction
  struct acc_meta
  {
    acc_meta();
    acc_meta( const pub_key&, bool is_signer, bool is_writable );
    pub_key key_;
    bool    is_signer_;
    bool    is_writable_;
  };

  typedef std::vector<acc_meta> acc_meta_vec_t;
  typedef std::vector<char>     instr_data_t;

  // instruction prior to compilation into a transaction
  struct instruction
  {
    void add_account( const pub_key&, bool is_signer, bool is_writable );
    void set_data( const bincode& );
    pub_key        prog_;
    acc_meta_vec_t accs_;
    instr_data_t   data_;
  };

  typedef std::vector<instruction>     instruction_vec_t;
  typedef std::vector<const key_pair*> signer_vec_t;

  // transaction message construction
  namespace tx
  {
    // maximum size of serialized transaction
    static const size_t max_len = 1232;

    // system program instruction codes
    enum system_instruction
    {
      e_create_account = 0,
      e_assign = 1,
      e_transfer = 2
    };

    // system program id (all zeros)
    const pub_key& get_system_id();

    // construct system transfer instruction
    void transfer( instruction&,
                   const pub_key& sender,
                   const pub_key& receiver,
                   uint64_t lamports );

    // compile instructions into a signed transaction
    // the first signer pays and is listed first
    bool build( bincode&,
                const hash& recent_hash,
                const instruction_vec_t&,
                const signer_vec_t& );
  }

  // parsed transaction over an external buffer
  class tx_msg
  {
  public:

    struct instr
    {
      uint8_t        prog_idx_;
      unsigned       num_accs_;
      const uint8_t *acc_idx_;
      size_t         data_len_;
      const uint8_t *data_;
    };

    // decode and structurally validate wire format
    err_code parse( const char *buf, size_t len );

    // check all signatures against the message bytes
    err_code verify() const;

    unsigned get_num_signatures() const;
    const signature& get_signature( unsigned ) const;

    unsigned get_num_keys() const;
    const pub_key& get_key( unsigned ) const;
    bool is_signer( unsigned ) const;
    bool is_writable( unsigned ) const;

    const hash& get_recent_hash() const;

    unsigned get_num_instrs() const;
    const instr& get_instr( unsigned ) const;

  private:
    typedef std::vector<signature> sig_vec_t;
    typedef std::vector<pub_key>   key_vec_t;
    typedef std::vector<instr>     instr_vec_t;

    sig_vec_t      sigv_;
    key_vec_t      keyv_;
    instr_vec_t    insv_;
    hash           rhash_;
    uint8_t        num_req_sigs_;
    uint8_t        num_ro_signed_;
    uint8_t        num_ro_unsigned_;
    const uint8_t *msg_;
    size_t         msg_len_;
  };

  inline unsigned tx_msg::get_num_signatures() const
  {
    return sigv_.size();
  }

  inline const signature& tx_msg::get_signature( unsigned i ) const
  {
    return sigv_[i];
  }

  inline unsigned tx_msg::get_num_keys() const
  {
    return keyv_.size();
  }

  inline const pub_key& tx_msg::get_key( unsigned i ) const
  {
    return keyv_[i];
  }

  inline bool tx_msg::is_signer( unsigned i ) const
  {
    return i < num_req_sigs_;
  }

  inline bool tx_msg::is_writable( unsigned i ) const
  {
    if ( i < num_req_sigs_ ) {
      return i < (unsigned)( num_req_sigs_ - num_ro_signed_ );
    }
    return i < keyv_.size() - num_ro_unsigned_;
  }

  inline const hash& tx_msg::get_recent_hash() const
  {
    return rhash_;
  }

  inline unsigned tx_msg::get_num_instrs() const
  {
    return insv_.size();
  }

  inline const tx_msg::instr& tx_msg::get_instr( unsigned i ) const
  {
    return insv_[i];
  }

}
