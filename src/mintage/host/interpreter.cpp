#include <mintage/host/interpreter.hpp>

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>

namespace mintage::host {

static result< std::string > complete( std::error_code ec )
{
  if( ec )
    return std::unexpected( ec );

  return std::string{};
}

interpreter::interpreter( ledger::ledger& l ) noexcept:
    _ledger( &l )
{}

result< std::string > interpreter::execute( std::string_view line )
{
  // Command name to instruction and argument count
  static const std::map< std::string, std::pair< command, std::size_t >, std::less<> > commands{
    {      "transfer",      { command::transfer, 3 } },
    {       "approve",       { command::approve, 3 } },
    { "transfer_from", { command::transfer_from, 4 } },
    {          "burn",          { command::burn, 2 } },
    {         "issue",         { command::issue, 2 } },
    {    "balance_of",    { command::balance_of, 1 } },
    {     "allowance",     { command::allowance, 2 } },
    {  "total_supply",  { command::total_supply, 0 } }
  };

  std::string text( line.substr( 0, line.find( '#' ) ) );
  boost::algorithm::trim( text );

  if( text.empty() )
    return std::string{};

  std::vector< std::string > tokens;
  boost::algorithm::split( tokens, text, boost::algorithm::is_space(), boost::algorithm::token_compress_on );

  auto it = commands.find( tokens.front() );
  if( it == commands.end() )
    return std::unexpected( host_errc::unknown_command );

  std::span< const std::string > args( tokens.begin() + 1, tokens.end() );
  const auto& [ cmd, arity ] = it->second;
  if( args.size() != arity )
    return std::unexpected( host_errc::invalid_arguments );

  return execute( cmd, args );
}

result< std::string > interpreter::execute( command cmd, std::span< const std::string > args )
{
  std::vector< protocol::account > accounts;
  std::optional< protocol::amount > value;

  // The value, when there is one, is always the last argument
  const bool has_value = cmd != command::balance_of && cmd != command::allowance && cmd != command::total_supply;
  const auto account_args = has_value ? args.first( args.size() - 1 ) : args;

  for( const auto& arg: account_args )
  {
    auto account = protocol::account_from_hex( arg );
    if( !account )
      return std::unexpected( account.error() );

    accounts.push_back( *account );
  }

  if( has_value )
  {
    auto amount = protocol::amount_from_string( args.back() );
    if( !amount )
      return std::unexpected( amount.error() );

    value = *amount;
  }

  switch( cmd )
  {
    case command::transfer:
      return complete( _ledger->transfer( accounts[ 0 ], accounts[ 1 ], *value ) );
    case command::approve:
      return complete( _ledger->approve( accounts[ 0 ], accounts[ 1 ], *value ) );
    case command::transfer_from:
      return complete( _ledger->transfer_from( accounts[ 0 ], accounts[ 1 ], accounts[ 2 ], *value ) );
    case command::burn:
      return complete( _ledger->burn( accounts[ 0 ], *value ) );
    case command::issue:
      return complete( _ledger->issue( accounts[ 0 ], *value ) );
    case command::balance_of:
      return protocol::to_string( _ledger->balance_of( accounts[ 0 ] ) );
    case command::allowance:
      return protocol::to_string( _ledger->allowance( accounts[ 0 ], accounts[ 1 ] ) );
    case command::total_supply:
      return protocol::to_string( _ledger->total_supply() );
  }

  std::unreachable();
}

} // namespace mintage::host
