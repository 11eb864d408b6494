#pragma once

#include <lp/account_db.hpp>
#include <lp/bincode.hpp>
#include <lp/key_pair.hpp>
#include <string>

// marketplace program version
#define LP_VERSION 1

namespace lp
{

  // marketplace field limits in bytes
  static const size_t max_name_len        = 50;
  static const size_t max_title_len       = 100;
  static const size_t max_description_len = 500;
  static const size_t max_link_len        = 200;
  static const size_t max_narration_len   = 300;
  static const size_t max_review_len      = 300;

  // size of account and instruction discriminators
  static const size_t disc_len = 8;

  enum user_role
  {
    e_client = 0,
    e_freelancer = 1
  };

  str user_role_to_str( user_role );
  bool str_to_user_role( str, user_role& );

  // marketplace instructions
  enum market_instr
  {
    e_register_user = 0,
    e_initialize_job_post,
    e_apply_to_job,
    e_approve_application,
    e_submit_work,
    e_approve_submission,
    e_num_market_instr
  };

  str market_instr_to_str( market_instr );

  // sha256("global:<name>")[0..8]
  void get_instr_disc( market_instr, uint8_t *disc );

  // sha256("account:<type>")[0..8]
  void get_account_disc( str type_name, uint8_t *disc );

  // optional unix timestamp
  struct opt_ts
  {
    opt_ts();
    explicit opt_ts( int64_t );
    bool    has_val_;
    int64_t val_;
  };

  // identity record
  struct user_account
  {
    static const size_t space = disc_len + 32 + 4 + max_name_len + 1;
    static str get_type_name();

    user_account();
    bool encode( acc_data_t& ) const;
    bool decode( const acc_data_t& );

    pub_key     wallet_;
    std::string name_;
    user_role   role_;
  };

  // job post record
  struct job_post
  {
    static const size_t space = disc_len + 32 + 4 + max_title_len + 8 +
      4 + max_description_len + 1 + 1 + 9 + 9;
    static str get_type_name();

    job_post();
    bool encode( acc_data_t& ) const;
    bool decode( const acc_data_t& );

    pub_key     client_;
    std::string title_;
    uint64_t    amount_;
    std::string description_;
    bool        is_filled_;
    uint8_t     escrow_bump_;
    opt_ts      start_date_;
    opt_ts      end_date_;
  };

  // application record
  struct application
  {
    static const size_t space = disc_len + 32 + 32 + 4 + max_link_len +
      1 + 1 + 4 + max_link_len + 4 + max_narration_len +
      4 + max_review_len + 9 + 1;
    static str get_type_name();

    application();
    bool encode( acc_data_t& ) const;
    bool decode( const acc_data_t& );

    pub_key     applicant_;
    pub_key     job_post_;
    std::string resume_link_;
    bool        approved_;
    bool        completed_;
    std::string submission_link_;
    std::string narration_;
    std::string client_review_;
    opt_ts      expected_end_date_;
    bool        paid_;
  };

  // marketplace program id
  const pub_key& get_market_program_id();

  // seeds of a program-derived record address
  // seeds reference storage inside this object
  class pda_seeds
  {
  public:
    pda_seeds();

    // ["user", wallet]
    void init_user( const pub_key& wallet );

    // ["job_post", client, sha256(title)]
    void init_job_post( const pub_key& client, str title );

    // ["escrow", job_post]
    void init_escrow( const pub_key& job );

    // ["application", job_post, applicant]
    void init_application( const pub_key& job, const pub_key& applicant );

    // search bump and append it to seeds
    bool find( const pub_key& prog, pub_key& addr );

    // append known bump and derive address
    bool create( const pub_key& prog, uint8_t bump, pub_key& addr );

    uint8_t get_bump() const;
    const seed_vec_t& get_seeds() const;

  private:
    pda_seeds( const pda_seeds& );
    pda_seeds& operator=( const pda_seeds& );
    void reset( const char *prefix );
    seed_vec_t seeds_;
    hash       k1_;
    hash       k2_;
    uint8_t    bump_;
  };

  // derived record addresses under the marketplace program
  bool find_user_address( const pub_key& wallet, pub_key& addr );
  bool find_job_address( const pub_key& client, str title, pub_key& addr );
  bool find_escrow_address( const pub_key& job, pub_key& addr );
  bool find_application_address( const pub_key& job,
                                 const pub_key& applicant,
                                 pub_key& addr );

  inline uint8_t pda_seeds::get_bump() const
  {
    return bump_;
  }

  inline const seed_vec_t& pda_seeds::get_seeds() const
  {
    return seeds_;
  }

}
