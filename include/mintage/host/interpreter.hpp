#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <mintage/host/error.hpp>
#include <mintage/ledger/ledger.hpp>

namespace mintage::host {

/**
 * Runs text commands against a ledger, one command per line.
 *
 *   transfer <caller> <to> <value>
 *   approve <caller> <spender> <value>
 *   transfer_from <caller> <owner> <to> <value>
 *   burn <caller> <value>
 *   issue <caller> <value>
 *   balance_of <account>
 *   allowance <owner> <spender>
 *   total_supply
 *
 * Accounts are hex, values are decimal. Everything after '#' is ignored.
 * Read commands return the value as decimal text, every other successful line
 * returns an empty string. A failing ledger operation returns the ledger's
 * error code unchanged.
 */
class interpreter final
{
public:
  explicit interpreter( ledger::ledger& l ) noexcept;
  interpreter( const interpreter& ) = delete;
  interpreter( interpreter&& )      = delete;
  ~interpreter()                    = default;

  interpreter& operator=( const interpreter& ) = delete;
  interpreter& operator=( interpreter&& )      = delete;

  result< std::string > execute( std::string_view line );

private:
  enum class command : std::uint8_t
  {
    transfer,
    approve,
    transfer_from,
    burn,
    issue,
    balance_of,
    allowance,
    total_supply
  };

  result< std::string > execute( command cmd, std::span< const std::string > args );

  ledger::ledger* _ledger;
};

} // namespace mintage::host
