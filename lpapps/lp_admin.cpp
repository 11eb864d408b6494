#include <lp/market_client.hpp>
#include <lp/market.hpp>
#include <lp/key_store.hpp>
#include <lp/log.hpp>

#include <unistd.h>
#include <stdlib.h>
#include <string.h>
#include <signal.h>
#include <sys/stat.h>
#include <iostream>

// marketplace ledger administration tool

using namespace lp;

static std::string get_default_key_store()
{
  const char *home = getenv( "HOME" );
  return std::string( home ? home : "." ) + "/.lp/";
}

static const std::string DEFAULT_KEY_STORE = get_default_key_store();
static const std::string DEFAULT_LEDGER    = "ledger.gz";

int usage()
{
  using namespace std;
  cerr << "usage: lp_admin" << endl;
  cerr << "  init_key            <name> [options]" << endl;
  cerr << "  airdrop             <wallet> <lamports> [options]" << endl;
  cerr << "  transfer            <name> <wallet> <lamports> [options]" << endl;
  cerr << "  balance             <wallet> [options]" << endl;
  cerr << "  register_user       <name> <display_name> <client|freelancer> "
          "[options]" << endl;
  cerr << "  post_job            <name> <title> <description> <amount> "
          "[<start_date> <end_date>] [options]" << endl;
  cerr << "  apply_to_job        <name> <job_key> <resume_link> "
          "[<expected_end_date>] [options]" << endl;
  cerr << "  approve_application <name> <job_key> <application_key> "
          "[options]" << endl;
  cerr << "  submit_work         <name> <application_key> <submission_link> "
          "<narration> [options]" << endl;
  cerr << "  approve_submission  <name> <job_key> <application_key> "
          "<client_review> [options]" << endl;
  cerr << "  get_user            <wallet> [options]" << endl;
  cerr << "  get_job             <job_key> [options]" << endl;
  cerr << "  get_application     <application_key> [options]" << endl;
  cerr << "  list_jobs           [options]" << endl;
  cerr << "  version" << endl;
  cerr << endl;
  cerr << "wallets are given as a key store name or a base58 public key"
       << endl;
  cerr << "dates are unix timestamps in seconds" << endl;
  cerr << endl;

  cerr << "options include:" << endl;
  cerr << "  -k <key_store_directory (default " << DEFAULT_KEY_STORE << ")>"
       << endl;
  cerr << "     Directory name housing wallet key files\n" << endl;
  cerr << "  -s <ledger_snapshot (default <key_store>/" << DEFAULT_LEDGER
       << ")>" << endl;
  cerr << "     Gzip file holding the ledger between invocations\n" << endl;
  cerr << "  -t <unix_time>" << endl;
  cerr << "     Override ledger clock\n" << endl;
  cerr << "  -l <log_file>" << endl;
  cerr << "     Write log output to file instead of stderr\n" << endl;
  cerr << "  -d" << endl;
  cerr << "     Turn on debug logging\n" << endl;
  cerr << "  -h" << endl;
  cerr << "     Output this help text\n" << endl;
  return 1;
}

struct lp_arguments
{
  lp_arguments( int argc, char **argv );

  bool         invalid_   = false;
  std::string  key_dir_   = DEFAULT_KEY_STORE;
  std::string  ledger_;
  int64_t      clock_     = 0;
};

lp_arguments::lp_arguments( int argc, char **argv )
{
  int opt = 0;
  while ( (opt = ::getopt( argc, argv, "k:s:t:l:dh" )) != -1 ) {
    switch (opt) {
      case 'k': key_dir_ = optarg; break;
      case 's': ledger_ = optarg; break;
      case 't': {
        if ( !str_to_int( optarg, strlen( optarg ), clock_ ) ) {
          std::cerr << "lp_admin: invalid clock" << std::endl;
          invalid_ = true;
        }
        break;
      }
      case 'l': {
        if ( !log::set_log_file( optarg ) ) {
          std::cerr << "lp_admin: failed to open log file" << std::endl;
          invalid_ = true;
        }
        break;
      }
      case 'd': log::set_level( LP_LOG_DBG_LVL ); break;
      default:
        usage();
        invalid_ = true;
    }
  }
  if ( !key_dir_.empty() && key_dir_.back() != '/' ) {
    key_dir_ += '/';
  }
  if ( ledger_.empty() ) {
    ledger_ = key_dir_ + DEFAULT_LEDGER;
  }
}

// ledger and key store shared by all commands
class lp_context
{
public:
  lp_context();
  bool init( const lp_arguments& );
  bool save();
  bool get_pub_key( const std::string&, pub_key& );
  bool get_key_pair( const std::string&, key_pair& );
  key_store& get_key_store() { return kst_; }
  bank& get_bank() { return bk_; }
  market_client& get_client() { return clnt_; }
private:
  key_store      kst_;
  bank           bk_;
  market_program mkt_;
  market_client  clnt_;
  std::string    ledger_;
};

lp_context::lp_context()
: clnt_( bk_ )
{
  bk_.add_program( &mkt_ );
}

bool lp_context::init( const lp_arguments& args )
{
  kst_.set_dir( args.key_dir_ );
  if ( !kst_.init() ) {
    std::cerr << "lp_admin: " << kst_.get_err_msg() << std::endl;
    return false;
  }
  ledger_ = args.ledger_;
  struct stat fst[1];
  if ( 0 == ::stat( ledger_.c_str(), fst ) && !bk_.load( ledger_ ) ) {
    std::cerr << "lp_admin: " << bk_.get_err_msg() << std::endl;
    return false;
  }
  bk_.set_clock( args.clock_ );
  return true;
}

bool lp_context::save()
{
  if ( !bk_.save( ledger_ ) ) {
    std::cerr << "lp_admin: " << bk_.get_err_msg() << std::endl;
    return false;
  }
  return true;
}

bool lp_context::get_key_pair( const std::string& name, key_pair& kp )
{
  if ( !kst_.get_key_pair( name, kp ) ) {
    std::cerr << "lp_admin: " << kst_.get_err_msg() << std::endl;
    return false;
  }
  return true;
}

bool lp_context::get_pub_key( const std::string& txt, pub_key& pk )
{
  key_pair kp;
  struct stat fst[1];
  if ( 0 == ::stat( kst_.get_key_pair_file( txt ).c_str(), fst ) &&
       kst_.get_key_pair( txt, kp ) ) {
    kp.get_pub_key( pk );
    return true;
  }
  if ( pk.init_from_text( txt ) ) {
    return true;
  }
  std::cerr << "lp_admin: unknown wallet or key [" << txt << "]"
            << std::endl;
  return false;
}

// number of positional arguments preceding the options
static int get_num_pos( int argc, char **argv )
{
  int num = 0;
  while( num + 1 < argc && argv[num+1][0] != '-' ) {
    ++num;
  }
  return num;
}

static bool parse_uint( const char *txt, uint64_t& val )
{
  if ( !str_to_uint( txt, strlen( txt ), val ) ) {
    std::cerr << "lp_admin: invalid number [" << txt << "]" << std::endl;
    return false;
  }
  return true;
}

static bool parse_ts( const char *txt, opt_ts& val )
{
  int64_t ts;
  if ( !str_to_int( txt, strlen( txt ), ts ) ) {
    std::cerr << "lp_admin: invalid timestamp [" << txt << "]" << std::endl;
    return false;
  }
  val = opt_ts( ts );
  return true;
}

// report transaction outcome and persist ledger on success
static int on_result( lp_context& ctx, err_code rc )
{
  if ( rc != e_success ) {
    std::cerr << "lp_admin: transaction failed ["
              << err_code_to_str( rc ).as_string() << "]" << std::endl;
    return 1;
  }
  return ctx.save() ? 0 : 1;
}

void print_val( str val, size_t sp=0 )
{
  static const char spaces[] =
  "                                                                          ";
  static const char dots[] =
  "..........................................................................";

  size_t num = 20 - sp;
  std::cout.write( spaces, static_cast< std::streamsize >( sp ) );
  std::cout.write( val.str_, static_cast< std::streamsize >( val.len_ ) );
  if ( num > val.len_ ) {
    std::cout.write( dots, static_cast< std::streamsize >( num - val.len_ ) );
  }
  std::cout << ' ';
}

static void print_ts( const opt_ts& ts )
{
  if ( ts.has_val_ ) {
    std::cout << ts.val_ << std::endl;
  } else {
    std::cout << "none" << std::endl;
  }
}

static void print_job( const pub_key& key, const job_post& job,
                       uint64_t escrow_balance )
{
  print_val( "job" );
  std::cout << key.as_string() << std::endl;
  print_val( "client", 2 );
  std::cout << job.client_.as_string() << std::endl;
  print_val( "title", 2 );
  std::cout << job.title_ << std::endl;
  print_val( "description", 2 );
  std::cout << job.description_ << std::endl;
  print_val( "amount", 2 );
  std::cout << job.amount_ << std::endl;
  print_val( "escrow_balance", 2 );
  std::cout << escrow_balance << std::endl;
  print_val( "filled", 2 );
  std::cout << ( job.is_filled_ ? "true" : "false" ) << std::endl;
  print_val( "start_date", 2 );
  print_ts( job.start_date_ );
  print_val( "end_date", 2 );
  print_ts( job.end_date_ );
}

int on_init_key( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 1 ) {
    return usage();
  }
  std::string name( argv[1] );
  argc -= 1;
  argv += 1;

  lp_arguments args( argc, argv );
  if ( args.invalid_ )
    return 1;

  key_store kst;
  kst.set_dir( args.key_dir_ );
  if ( !kst.create() || !kst.init() ) {
    std::cerr << "lp_admin: " << kst.get_err_msg() << std::endl;
    return 1;
  }
  key_pair kp;
  if ( !kst.create_key_pair( name, kp ) ) {
    std::cerr << "lp_admin: failed to create key pair ["
      << kst.get_key_pair_file( name ) << "]" << std::endl;
    std::cerr << "lp_admin: " << kst.get_err_msg() << std::endl;
    return 1;
  }
  std::cout << pub_key( kp ).as_string() << std::endl;
  return 0;
}

int on_airdrop( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 2 ) {
    return usage();
  }
  std::string wallet( argv[1] );
  const char *amt = argv[2];
  argc -= 2;
  argv += 2;

  lp_arguments args( argc, argv );
  lp_context ctx;
  pub_key pk;
  uint64_t lamports;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_pub_key( wallet, pk ) || !parse_uint( amt, lamports ) ) {
    return 1;
  }
  if ( !ctx.get_bank().airdrop( pk, lamports ) ) {
    std::cerr << "lp_admin: " << ctx.get_bank().get_err_msg() << std::endl;
    return 1;
  }
  return ctx.save() ? 0 : 1;
}

int on_transfer( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 3 ) {
    return usage();
  }
  std::string name( argv[1] );
  std::string wallet( argv[2] );
  const char *amt = argv[3];
  argc -= 3;
  argv += 3;

  lp_arguments args( argc, argv );
  lp_context ctx;
  key_pair kp;
  pub_key to;
  uint64_t lamports;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_key_pair( name, kp ) || !ctx.get_pub_key( wallet, to ) ||
       !parse_uint( amt, lamports ) ) {
    return 1;
  }
  return on_result( ctx, ctx.get_client().transfer( kp, to, lamports ) );
}

int on_balance( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 1 ) {
    return usage();
  }
  std::string wallet( argv[1] );
  argc -= 1;
  argv += 1;

  lp_arguments args( argc, argv );
  lp_context ctx;
  pub_key pk;
  if ( args.invalid_ || !ctx.init( args ) || !ctx.get_pub_key( wallet, pk ) ) {
    return 1;
  }
  std::cout << ctx.get_client().get_balance( pk ) << std::endl;
  return 0;
}

int on_register_user( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 3 ) {
    return usage();
  }
  std::string name( argv[1] );
  std::string display_name( argv[2] );
  user_role role;
  if ( !str_to_user_role( argv[3], role ) ) {
    std::cerr << "lp_admin: role must be client or freelancer" << std::endl;
    return 1;
  }
  argc -= 3;
  argv += 3;

  lp_arguments args( argc, argv );
  lp_context ctx;
  key_pair kp;
  if ( args.invalid_ || !ctx.init( args ) || !ctx.get_key_pair( name, kp ) ) {
    return 1;
  }
  return on_result( ctx,
      ctx.get_client().register_user( kp, display_name, role ) );
}

int on_post_job( int argc, char **argv )
{
  int npos = get_num_pos( argc, argv );
  if ( npos != 4 && npos != 6 ) {
    return usage();
  }
  std::string name( argv[1] );
  std::string title( argv[2] );
  std::string desc( argv[3] );
  uint64_t amount;
  opt_ts start_date, end_date;
  if ( !parse_uint( argv[4], amount ) ) {
    return 1;
  }
  if ( npos == 6 &&
       ( !parse_ts( argv[5], start_date ) ||
         !parse_ts( argv[6], end_date ) ) ) {
    return 1;
  }
  argc -= npos;
  argv += npos;

  lp_arguments args( argc, argv );
  lp_context ctx;
  key_pair kp;
  if ( args.invalid_ || !ctx.init( args ) || !ctx.get_key_pair( name, kp ) ) {
    return 1;
  }
  pub_key job;
  int rc = on_result( ctx, ctx.get_client().post_job(
        kp, title, desc, amount, start_date, end_date, job ) );
  if ( rc == 0 ) {
    std::cout << job.as_string() << std::endl;
  }
  return rc;
}

int on_apply_to_job( int argc, char **argv )
{
  int npos = get_num_pos( argc, argv );
  if ( npos != 3 && npos != 4 ) {
    return usage();
  }
  std::string name( argv[1] );
  std::string job_txt( argv[2] );
  std::string resume( argv[3] );
  opt_ts expected_end;
  if ( npos == 4 && !parse_ts( argv[4], expected_end ) ) {
    return 1;
  }
  argc -= npos;
  argv += npos;

  lp_arguments args( argc, argv );
  lp_context ctx;
  key_pair kp;
  pub_key job;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_key_pair( name, kp ) || !ctx.get_pub_key( job_txt, job ) ) {
    return 1;
  }
  pub_key app;
  int rc = on_result( ctx, ctx.get_client().apply_to_job(
        kp, job, resume, expected_end, app ) );
  if ( rc == 0 ) {
    std::cout << app.as_string() << std::endl;
  }
  return rc;
}

int on_approve_application( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 3 ) {
    return usage();
  }
  std::string name( argv[1] );
  std::string job_txt( argv[2] );
  std::string app_txt( argv[3] );
  argc -= 3;
  argv += 3;

  lp_arguments args( argc, argv );
  lp_context ctx;
  key_pair kp;
  pub_key job, app;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_key_pair( name, kp ) ||
       !ctx.get_pub_key( job_txt, job ) ||
       !ctx.get_pub_key( app_txt, app ) ) {
    return 1;
  }
  return on_result( ctx,
      ctx.get_client().approve_application( kp, job, app ) );
}

int on_submit_work( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 4 ) {
    return usage();
  }
  std::string name( argv[1] );
  std::string app_txt( argv[2] );
  std::string link( argv[3] );
  std::string narration( argv[4] );
  argc -= 4;
  argv += 4;

  lp_arguments args( argc, argv );
  lp_context ctx;
  key_pair kp;
  pub_key app;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_key_pair( name, kp ) || !ctx.get_pub_key( app_txt, app ) ) {
    return 1;
  }
  return on_result( ctx,
      ctx.get_client().submit_work( kp, app, link, narration ) );
}

int on_approve_submission( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 4 ) {
    return usage();
  }
  std::string name( argv[1] );
  std::string job_txt( argv[2] );
  std::string app_txt( argv[3] );
  std::string review( argv[4] );
  argc -= 4;
  argv += 4;

  lp_arguments args( argc, argv );
  lp_context ctx;
  key_pair kp;
  pub_key job, app;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_key_pair( name, kp ) ||
       !ctx.get_pub_key( job_txt, job ) ||
       !ctx.get_pub_key( app_txt, app ) ) {
    return 1;
  }
  return on_result( ctx,
      ctx.get_client().approve_submission( kp, job, app, review ) );
}

int on_get_user( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 1 ) {
    return usage();
  }
  std::string wallet( argv[1] );
  argc -= 1;
  argv += 1;

  lp_arguments args( argc, argv );
  lp_context ctx;
  pub_key pk;
  if ( args.invalid_ || !ctx.init( args ) || !ctx.get_pub_key( wallet, pk ) ) {
    return 1;
  }
  user_account user;
  if ( !ctx.get_client().get_user( pk, user ) ) {
    std::cerr << "lp_admin: user not registered" << std::endl;
    return 1;
  }
  print_val( "user" );
  std::cout << user.wallet_.as_string() << std::endl;
  print_val( "name", 2 );
  std::cout << user.name_ << std::endl;
  print_val( "role", 2 );
  std::cout << user_role_to_str( user.role_ ).as_string() << std::endl;
  print_val( "balance", 2 );
  std::cout << ctx.get_client().get_balance( pk ) << std::endl;
  return 0;
}

int on_get_job( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 1 ) {
    return usage();
  }
  std::string job_txt( argv[1] );
  argc -= 1;
  argv += 1;

  lp_arguments args( argc, argv );
  lp_context ctx;
  pub_key key;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_pub_key( job_txt, key ) ) {
    return 1;
  }
  job_post job;
  if ( !ctx.get_client().get_job( key, job ) ) {
    std::cerr << "lp_admin: job not found" << std::endl;
    return 1;
  }
  print_job( key, job, ctx.get_client().get_escrow_balance( key ) );
  key_app_vec_t appv;
  ctx.get_client().list_applications( key, appv );
  for( const key_app_t& ka: appv ) {
    print_val( "application", 2 );
    std::cout << ka.first.as_string() << std::endl;
  }
  return 0;
}

int on_get_application( int argc, char **argv )
{
  if ( get_num_pos( argc, argv ) != 1 ) {
    return usage();
  }
  std::string app_txt( argv[1] );
  argc -= 1;
  argv += 1;

  lp_arguments args( argc, argv );
  lp_context ctx;
  pub_key key;
  if ( args.invalid_ || !ctx.init( args ) ||
       !ctx.get_pub_key( app_txt, key ) ) {
    return 1;
  }
  application app;
  if ( !ctx.get_client().get_application( key, app ) ) {
    std::cerr << "lp_admin: application not found" << std::endl;
    return 1;
  }
  print_val( "application" );
  std::cout << key.as_string() << std::endl;
  print_val( "applicant", 2 );
  std::cout << app.applicant_.as_string() << std::endl;
  print_val( "job", 2 );
  std::cout << app.job_post_.as_string() << std::endl;
  print_val( "resume_link", 2 );
  std::cout << app.resume_link_ << std::endl;
  print_val( "expected_end_date", 2 );
  print_ts( app.expected_end_date_ );
  print_val( "approved", 2 );
  std::cout << ( app.approved_ ? "true" : "false" ) << std::endl;
  print_val( "completed", 2 );
  std::cout << ( app.completed_ ? "true" : "false" ) << std::endl;
  print_val( "submission_link", 2 );
  std::cout << app.submission_link_ << std::endl;
  print_val( "narration", 2 );
  std::cout << app.narration_ << std::endl;
  print_val( "client_review", 2 );
  std::cout << app.client_review_ << std::endl;
  print_val( "paid", 2 );
  std::cout << ( app.paid_ ? "true" : "false" ) << std::endl;
  return 0;
}

int on_list_jobs( int argc, char **argv )
{
  lp_arguments args( argc, argv );
  lp_context ctx;
  if ( args.invalid_ || !ctx.init( args ) ) {
    return 1;
  }
  key_job_vec_t jobv;
  ctx.get_client().list_jobs( jobv );
  for( const key_job_t& kj: jobv ) {
    print_job( kj.first, kj.second,
               ctx.get_client().get_escrow_balance( kj.first ) );
    std::cout << std::endl;
  }
  return 0;
}

int main(int argc, char **argv)
{
  if ( argc < 2 ) {
    return usage();
  }
  --argc;
  ++argv;

  // set up signal handing
  signal( SIGPIPE, SIG_IGN );
  log::set_level( LP_LOG_ERR_LVL );

  // dispatch by command
  std::string cmd( argv[0] );
  int rc = 0;
  if ( cmd == "init_key" ) {
    rc = on_init_key( argc, argv );
  } else if ( cmd == "airdrop" ) {
    rc = on_airdrop( argc, argv );
  } else if ( cmd == "transfer" ) {
    rc = on_transfer( argc, argv );
  } else if ( cmd == "balance" ) {
    rc = on_balance( argc, argv );
  } else if ( cmd == "register_user" ) {
    rc = on_register_user( argc, argv );
  } else if ( cmd == "post_job" ) {
    rc = on_post_job( argc, argv );
  } else if ( cmd == "apply_to_job" ) {
    rc = on_apply_to_job( argc, argv );
  } else if ( cmd == "approve_application" ) {
    rc = on_approve_application( argc, argv );
  } else if ( cmd == "submit_work" ) {
    rc = on_submit_work( argc, argv );
  } else if ( cmd == "approve_submission" ) {
    rc = on_approve_submission( argc, argv );
  } else if ( cmd == "get_user" ) {
    rc = on_get_user( argc, argv );
  } else if ( cmd == "get_job" ) {
    rc = on_get_job( argc, argv );
  } else if ( cmd == "get_application" ) {
    rc = on_get_application( argc, argv );
  } else if ( cmd == "list_jobs" ) {
    rc = on_list_jobs( argc, argv );
  } else if ( cmd == "version" ) {
    std::cout << "version: " << LP_VERSION << std::endl;
  } else {
    std::cerr << "lp_admin: unknown command" << std::endl;
    rc = usage();
  }
  return rc;
}
