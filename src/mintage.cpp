#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string>

#include <boost/program_options.hpp>

#include <mintage/host.hpp>
#include <mintage/ledger.hpp>
#include <mintage/log.hpp>
#include <mintage/protocol.hpp>

auto main( int argc, char** argv ) -> int
{
  boost::program_options::options_description options;

  // clang-format off
  options.add_options()
    ( "help,h"     , "Print this help message and exit" )
    ( "version,v"  , "Print version string and exit" )
    ( "issuer,i"   , boost::program_options::value< std::string >(), "The account creating the ledger, in hex" )
    ( "supply,s"   , boost::program_options::value< std::string >()->default_value( "0" ), "Initial supply credited to the issuer" )
    ( "script,f"   , boost::program_options::value< std::string >(), "File of ledger commands, stdin if omitted" )
    ( "journal,j"  , boost::program_options::value< std::string >(), "File to write the binary event journal to" )
    ( "log-level,l", boost::program_options::value< std::string >()->default_value( "info" ), "The log filtering level" );
  // clang-format on

  boost::program_options::variables_map args;

  try
  {
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );
  }
  catch( const boost::program_options::error& e )
  {
    std::println( std::cerr, "{}", e.what() );
    return EXIT_FAILURE;
  }

  if( args.count( "help" ) )
  {
    options.print( std::cout );
    return EXIT_SUCCESS;
  }

  if( args.count( "version" ) )
  {
    std::println( "v0.1.0" );
    return EXIT_SUCCESS;
  }

  auto level = mintage::log::level_from_string( args[ "log-level" ].as< std::string >() );
  if( !level )
  {
    std::println( std::cerr, "Invalid log level: {}", args[ "log-level" ].as< std::string >() );
    return EXIT_FAILURE;
  }

  mintage::log::initialize( *level );

  if( !args.count( "issuer" ) )
  {
    LOG_ERROR( mintage::log::instance(), "Issuer is required" );
    return EXIT_FAILURE;
  }

  auto issuer = mintage::protocol::account_from_hex( args[ "issuer" ].as< std::string >() );
  if( !issuer )
  {
    LOG_ERROR( mintage::log::instance(), "Invalid issuer account: {}", issuer.error().message() );
    return EXIT_FAILURE;
  }

  auto supply = mintage::protocol::amount_from_string( args[ "supply" ].as< std::string >() );
  if( !supply )
  {
    LOG_ERROR( mintage::log::instance(), "Invalid initial supply: {}", supply.error().message() );
    return EXIT_FAILURE;
  }

  std::ifstream script_file;
  std::istream* script = &std::cin;

  if( args.count( "script" ) )
  {
    const auto path = args[ "script" ].as< std::string >();
    script_file.open( path );
    if( !script_file )
    {
      LOG_ERROR( mintage::log::instance(), "Could not open script: {}", path );
      return EXIT_FAILURE;
    }

    script = &script_file;
    LOG_INFO( mintage::log::instance(), "Reading commands from {}", path );
  }

  std::ofstream journal_file;
  std::unique_ptr< mintage::host::journal > journal;
  mintage::host::recorder recorder;
  mintage::ledger::event_sink* sink = &recorder;

  if( args.count( "journal" ) )
  {
    const auto path = args[ "journal" ].as< std::string >();
    journal_file.open( path, std::ios::binary | std::ios::trunc );
    if( !journal_file )
    {
      LOG_ERROR( mintage::log::instance(), "Could not open journal: {}", path );
      return EXIT_FAILURE;
    }

    journal = std::make_unique< mintage::host::journal >( journal_file );
    sink    = journal.get();
    LOG_INFO( mintage::log::instance(), "Writing event journal to {}", path );
  }

  bool failed = false;

  try
  {
    mintage::ledger::ledger ledger( *supply, *issuer, *sink );
    mintage::host::interpreter interpreter( ledger );

    std::string line;
    std::size_t line_number = 0;

    while( std::getline( *script, line ) )
    {
      line_number++;

      auto output = interpreter.execute( line );

      if( !output )
      {
        failed = true;
        if( output.error().category() == mintage::ledger::ledger_category() )
          LOG_WARNING( mintage::log::instance(), "Line {}: operation failed: {}", line_number, output.error().message() );
        else
          LOG_ERROR( mintage::log::instance(), "Line {}: {}", line_number, output.error().message() );
      }
      else if( !output->empty() )
      {
        std::println( "{}", *output );
      }
    }

    if( !ledger.validate() )
    {
      LOG_CRITICAL( mintage::log::instance(), "Ledger balances do not add up to the total supply" );
      return EXIT_FAILURE;
    }

    LOG_INFO( mintage::log::instance(),
              "Processed {} lines, total supply is {}, {} events emitted",
              line_number,
              ledger.total_supply(),
              journal ? journal->size() : recorder.events().size() );
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( mintage::log::instance(), "Fatal error: {}", e.what() );
    return EXIT_FAILURE;
  }

  return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
