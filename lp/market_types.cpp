#include "market_types.hpp"
#include "digest.hpp"

using namespace lp;

static const char *user_role_str[] = {
  "client",
  "freelancer"
};

static const char *market_instr_str[] = {
  "register_user",
  "initialize_job_post",
  "apply_to_job",
  "approve_application",
  "submit_work",
  "approve_submission"
};

static_assert( sizeof( market_instr_str ) / sizeof( market_instr_str[0] ) ==
               (size_t)e_num_market_instr, "market_instr_str out of sync" );

str lp::user_role_to_str( user_role role )
{
  return role == e_freelancer ? user_role_str[1] : user_role_str[0];
}

bool lp::str_to_user_role( str txt, user_role& role )
{
  if ( txt == str( user_role_str[0] ) ) {
    role = e_client;
    return true;
  }
  if ( txt == str( user_role_str[1] ) ) {
    role = e_freelancer;
    return true;
  }
  return false;
}

str lp::market_instr_to_str( market_instr ins )
{
  unsigned ic = (unsigned)ins;
  if ( ic >= (unsigned)e_num_market_instr ) {
    return "unknown";
  }
  return market_instr_str[ic];
}

static void get_disc( str prefix, str name, uint8_t *disc )
{
  uint8_t buf[sha256::len];
  sha256 sh;
  sh.add( prefix );
  sh.add( name );
  sh.fin( buf );
  __builtin_memcpy( disc, buf, disc_len );
}

void lp::get_instr_disc( market_instr ins, uint8_t *disc )
{
  get_disc( "global:", market_instr_to_str( ins ), disc );
}

void lp::get_account_disc( str type_name, uint8_t *disc )
{
  get_disc( "account:", type_name, disc );
}

opt_ts::opt_ts()
: has_val_( false ), val_( 0 )
{
}

opt_ts::opt_ts( int64_t val )
: has_val_( true ), val_( val )
{
}

// prepare fixed size record buffer and write discriminator
static void init_record( acc_data_t& data, size_t space, str type_name,
                         bincode& wtr )
{
  uint8_t disc[disc_len];
  get_account_disc( type_name, disc );
  data.assign( space, 0 );
  wtr.attach( (char*)data.data(), space );
  wtr.add( (const char*)disc, disc_len );
}

// check discriminator and position reader after it
static bool check_record( const acc_data_t& data, str type_name,
                          bindec& rdr )
{
  uint8_t disc[disc_len];
  const char *ptr;
  get_account_disc( type_name, disc );
  return rdr.get_ref( ptr, disc_len ) &&
    0 == __builtin_memcmp( ptr, disc, disc_len ) &&
    data.size() >= disc_len;
}

static bool get_role( bindec& rdr, user_role& role )
{
  uint8_t val;
  if ( !rdr.get( val ) || val > (uint8_t)e_freelancer ) {
    return false;
  }
  role = (user_role)val;
  return true;
}

static bool get_str( bindec& rdr, std::string& val, size_t max_len )
{
  return rdr.get_str( val ) && val.length() <= max_len;
}

///////////////////////////////////////////////////////////////////////////
// user_account

str user_account::get_type_name()
{
  return "UserAccount";
}

user_account::user_account()
: role_( e_client )
{
}

bool user_account::encode( acc_data_t& data ) const
{
  if ( name_.length() > max_name_len ) {
    return false;
  }
  bincode wtr;
  init_record( data, space, get_type_name(), wtr );
  wtr.add( wallet_ );
  wtr.add_str( name_ );
  wtr.add( (uint8_t)role_ );
  return !wtr.get_is_overflow();
}

bool user_account::decode( const acc_data_t& data )
{
  bindec rdr( (const char*)data.data(), data.size() );
  return check_record( data, get_type_name(), rdr ) &&
    rdr.get( wallet_ ) &&
    get_str( rdr, name_, max_name_len ) &&
    get_role( rdr, role_ );
}

///////////////////////////////////////////////////////////////////////////
// job_post

str job_post::get_type_name()
{
  return "JobPost";
}

job_post::job_post()
: amount_( 0 ),
  is_filled_( false ),
  escrow_bump_( 0 )
{
}

bool job_post::encode( acc_data_t& data ) const
{
  if ( title_.length() > max_title_len ||
       description_.length() > max_description_len ) {
    return false;
  }
  bincode wtr;
  init_record( data, space, get_type_name(), wtr );
  wtr.add( client_ );
  wtr.add_str( title_ );
  wtr.add( amount_ );
  wtr.add_str( description_ );
  wtr.add_bool( is_filled_ );
  wtr.add( escrow_bump_ );
  wtr.add_opt( start_date_.has_val_, start_date_.val_ );
  wtr.add_opt( end_date_.has_val_, end_date_.val_ );
  return !wtr.get_is_overflow();
}

bool job_post::decode( const acc_data_t& data )
{
  bindec rdr( (const char*)data.data(), data.size() );
  return check_record( data, get_type_name(), rdr ) &&
    rdr.get( client_ ) &&
    get_str( rdr, title_, max_title_len ) &&
    rdr.get( amount_ ) &&
    get_str( rdr, description_, max_description_len ) &&
    rdr.get_bool( is_filled_ ) &&
    rdr.get( escrow_bump_ ) &&
    rdr.get_opt( start_date_.has_val_, start_date_.val_ ) &&
    rdr.get_opt( end_date_.has_val_, end_date_.val_ );
}

///////////////////////////////////////////////////////////////////////////
// application

str application::get_type_name()
{
  return "Application";
}

application::application()
: approved_( false ),
  completed_( false ),
  paid_( false )
{
}

bool application::encode( acc_data_t& data ) const
{
  if ( resume_link_.length() > max_link_len ||
       submission_link_.length() > max_link_len ||
       narration_.length() > max_narration_len ||
       client_review_.length() > max_review_len ) {
    return false;
  }
  bincode wtr;
  init_record( data, space, get_type_name(), wtr );
  wtr.add( applicant_ );
  wtr.add( job_post_ );
  wtr.add_str( resume_link_ );
  wtr.add_bool( approved_ );
  wtr.add_bool( completed_ );
  wtr.add_str( submission_link_ );
  wtr.add_str( narration_ );
  wtr.add_str( client_review_ );
  wtr.add_opt( expected_end_date_.has_val_, expected_end_date_.val_ );
  wtr.add_bool( paid_ );
  return !wtr.get_is_overflow();
}

bool application::decode( const acc_data_t& data )
{
  bindec rdr( (const char*)data.data(), data.size() );
  return check_record( data, get_type_name(), rdr ) &&
    rdr.get( applicant_ ) &&
    rdr.get( job_post_ ) &&
    get_str( rdr, resume_link_, max_link_len ) &&
    rdr.get_bool( approved_ ) &&
    rdr.get_bool( completed_ ) &&
    get_str( rdr, submission_link_, max_link_len ) &&
    get_str( rdr, narration_, max_narration_len ) &&
    get_str( rdr, client_review_, max_review_len ) &&
    rdr.get_opt( expected_end_date_.has_val_, expected_end_date_.val_ ) &&
    rdr.get_bool( paid_ );
}

///////////////////////////////////////////////////////////////////////////
// addresses

static pub_key init_market_program_id()
{
  pub_key prog_id;
  prog_id.init_from_text( "7XsphaTcfqrwkRmm7htDsko8tyqdnzmCLrycqpDFvVLe" );
  return prog_id;
}

const pub_key& lp::get_market_program_id()
{
  static const pub_key prog_id( init_market_program_id() );
  return prog_id;
}

pda_seeds::pda_seeds()
: bump_( 0 )
{
}

void pda_seeds::reset( const char *prefix )
{
  seeds_.clear();
  seeds_.push_back( str( prefix ) );
}

void pda_seeds::init_user( const pub_key& wallet )
{
  reset( "user" );
  k1_ = wallet;
  seeds_.push_back( str( k1_.data(), hash::len ) );
}

void pda_seeds::init_job_post( const pub_key& client, str title )
{
  reset( "job_post" );
  k1_ = client;
  sha256 sh;
  sh.add( title );
  sh.fin( k2_ );
  seeds_.push_back( str( k1_.data(), hash::len ) );
  seeds_.push_back( str( k2_.data(), hash::len ) );
}

void pda_seeds::init_escrow( const pub_key& job )
{
  reset( "escrow" );
  k1_ = job;
  seeds_.push_back( str( k1_.data(), hash::len ) );
}

void pda_seeds::init_application( const pub_key& job,
                                  const pub_key& applicant )
{
  reset( "application" );
  k1_ = job;
  k2_ = applicant;
  seeds_.push_back( str( k1_.data(), hash::len ) );
  seeds_.push_back( str( k2_.data(), hash::len ) );
}

bool pda_seeds::find( const pub_key& prog, pub_key& addr )
{
  if ( !addr.find_program_address( seeds_, prog, bump_ ) ) {
    return false;
  }
  seeds_.push_back( str( &bump_, 1 ) );
  return true;
}

bool pda_seeds::create( const pub_key& prog, uint8_t bump, pub_key& addr )
{
  bump_ = bump;
  seeds_.push_back( str( &bump_, 1 ) );
  return addr.create_program_address( seeds_, prog );
}

bool lp::find_user_address( const pub_key& wallet, pub_key& addr )
{
  pda_seeds seeds;
  seeds.init_user( wallet );
  return seeds.find( get_market_program_id(), addr );
}

bool lp::find_job_address( const pub_key& client, str title, pub_key& addr )
{
  pda_seeds seeds;
  seeds.init_job_post( client, title );
  return seeds.find( get_market_program_id(), addr );
}

bool lp::find_escrow_address( const pub_key& job, pub_key& addr )
{
  pda_seeds seeds;
  seeds.init_escrow( job );
  return seeds.find( get_market_program_id(), addr );
}

bool lp::find_application_address( const pub_key& job,
                                   const pub_key& applicant,
                                   pub_key& addr )
{
  pda_seeds seeds;
  seeds.init_application( job, applicant );
  return seeds.find( get_market_program_id(), addr );
}
