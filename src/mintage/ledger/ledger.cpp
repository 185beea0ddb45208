#include <mintage/ledger/ledger.hpp>

#include <mintage/log.hpp>

namespace mintage::ledger {

ledger::ledger( const protocol::amount& initial_supply, const protocol::account& creator, event_sink& sink ):
    _issuer( creator ),
    _total_supply( initial_supply ),
    _sink( &sink )
{
  _balances.insert_or_assign( creator, initial_supply );

  LOG_DEBUG( log::instance(), "Created ledger with supply {} issued to {}", initial_supply, creator );

  _sink->emit( protocol::created{ .from = creator, .total_supply = initial_supply } );
}

const protocol::account& ledger::issuer() const noexcept
{
  return _issuer;
}

const protocol::amount& ledger::total_supply() const noexcept
{
  return _total_supply;
}

protocol::amount ledger::balance_of( const protocol::account& account ) const
{
  if( auto it = _balances.find( account ); it != _balances.end() )
    return it->second;

  return 0;
}

protocol::amount ledger::allowance( const protocol::account& owner, const protocol::account& spender ) const
{
  if( auto it = _allowances.find( { owner, spender } ); it != _allowances.end() )
    return it->second;

  return 0;
}

std::error_code
ledger::transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value )
{
  auto from_balance = balance_of( caller );

  if( from_balance < value )
    return ledger_errc::insufficient_balance;

  from_balance    -= value;
  auto to_balance  = caller == to ? from_balance : balance_of( to );
  to_balance      += value;

  // A sink that throws aborts the operation before anything is committed
  _sink->emit( protocol::transfer{ .from = caller, .to = to, .value = value } );

  _balances.insert_or_assign( caller, from_balance );
  _balances.insert_or_assign( to, to_balance );

  LOG_DEBUG( log::instance(), "Transferred {} from {} to {}", value, caller, to );
  return ledger_errc::ok;
}

std::error_code
ledger::approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value )
{
  auto owner_balance = balance_of( caller );

  if( owner_balance < value )
    return ledger_errc::insufficient_balance;

  auto remaining  = allowance( caller, spender );
  owner_balance  -= value;
  remaining      += value;

  _sink->emit( protocol::approval{ .owner = caller, .spender = spender, .value = value } );

  _balances.insert_or_assign( caller, owner_balance );
  _allowances.insert_or_assign( { caller, spender }, remaining );

  LOG_DEBUG( log::instance(), "Approved {} from {} for {}, allowance is now {}", value, caller, spender, remaining );
  return ledger_errc::ok;
}

std::error_code ledger::transfer_from( const protocol::account& caller,
                                       const protocol::account& owner,
                                       const protocol::account& to,
                                       const protocol::amount& value )
{
  auto remaining = allowance( owner, caller );

  if( remaining < value )
    return ledger_errc::insufficient_allowance;

  auto to_balance  = balance_of( to );
  remaining       -= value;
  to_balance      += value;

  _sink->emit( protocol::transfer_from{ .from = caller, .owner = owner, .to = to, .value = value } );

  _allowances.insert_or_assign( { owner, caller }, remaining );
  _balances.insert_or_assign( to, to_balance );

  LOG_DEBUG( log::instance(), "Spender {} transferred {} of {}'s allowance to {}", caller, value, owner, to );
  return ledger_errc::ok;
}

std::error_code ledger::burn( const protocol::account& caller, const protocol::amount& value )
{
  auto from_balance = balance_of( caller );

  if( from_balance < value )
    return ledger_errc::insufficient_balance;

  auto supply   = _total_supply;
  from_balance -= value;
  supply       -= value;

  _sink->emit( protocol::burn{ .from = caller, .value = value } );

  _balances.insert_or_assign( caller, from_balance );
  _total_supply = supply;

  LOG_DEBUG( log::instance(), "Burned {} from {}, supply is now {}", value, caller, _total_supply );
  return ledger_errc::ok;
}

std::error_code ledger::issue( const protocol::account& caller, const protocol::amount& value )
{
  if( caller != _issuer )
    return ledger_errc::not_issuer;

  // Throws std::overflow_error before anything is committed
  auto supply      = _total_supply + value;
  auto to_balance  = balance_of( caller );
  to_balance      += value;

  _sink->emit( protocol::issue{ .issuer = caller, .value = value } );

  _balances.insert_or_assign( caller, to_balance );
  _total_supply = supply;

  LOG_DEBUG( log::instance(), "Issued {} to {}, supply is now {}", value, caller, _total_supply );
  return ledger_errc::ok;
}

bool ledger::validate() const
{
  protocol::amount sum = 0;

  for( const auto& [ account, balance ]: _balances )
    sum += balance;

  for( const auto& [ key, remaining ]: _allowances )
    sum += remaining;

  return sum == _total_supply;
}

} // namespace mintage::ledger
