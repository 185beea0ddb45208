#pragma once

#include <system_error>
#include <unordered_map>

#include <mintage/ledger/error.hpp>
#include <mintage/ledger/event_sink.hpp>
#include <mintage/protocol.hpp>

namespace mintage::ledger {

/**
 * Fungible token ledger.
 *
 * The caller of every mutating operation is passed in by the host. An
 * operation either succeeds, commits its state change and emits exactly one
 * event, or fails with a ledger_errc and leaves state and sink untouched.
 * The event is emitted before state is committed, so an exception thrown by
 * the sink leaves the ledger as it was.
 *
 * approve() moves value out of the owner's balance into an allowance that
 * only the named spender can draw down with transfer_from(). Outstanding
 * allowances therefore count towards the total supply.
 */
class ledger final
{
public:
  ledger( const protocol::amount& initial_supply, const protocol::account& creator, event_sink& sink );
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  const protocol::account& issuer() const noexcept;
  const protocol::amount& total_supply() const noexcept;
  protocol::amount balance_of( const protocol::account& account ) const;
  protocol::amount allowance( const protocol::account& owner, const protocol::account& spender ) const;

  std::error_code transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value );
  std::error_code
  approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value );
  std::error_code transfer_from( const protocol::account& caller,
                                 const protocol::account& owner,
                                 const protocol::account& to,
                                 const protocol::amount& value );
  std::error_code burn( const protocol::account& caller, const protocol::amount& value );
  std::error_code issue( const protocol::account& caller, const protocol::amount& value );

  // Checks that balances plus allowances add up to the total supply
  bool validate() const;

private:
  using balance_map   = std::unordered_map< protocol::account, protocol::amount, protocol::account_hash >;
  using allowance_map = std::unordered_map< protocol::account_pair, protocol::amount, protocol::account_hash >;

  const protocol::account _issuer;
  protocol::amount _total_supply;
  balance_map _balances;
  allowance_map _allowances;
  event_sink* _sink;
};

} // namespace mintage::ledger
