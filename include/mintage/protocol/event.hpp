#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/serialization/array.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <mintage/protocol/account.hpp>
#include <mintage/protocol/amount.hpp>
#include <mintage/protocol/error.hpp>

namespace mintage::protocol {

struct created
{
  account from{};
  amount total_supply = 0;

  bool operator==( const created& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & total_supply;
  }
};

struct transfer
{
  account from{};
  account to{};
  amount value = 0;

  bool operator==( const transfer& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & to;
    ar & value;
  }
};

struct approval
{
  account owner{};
  account spender{};
  amount value = 0;

  bool operator==( const approval& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
    ar & spender;
    ar & value;
  }
};

// `from` is the spender drawing on the allowance
struct transfer_from
{
  account from{};
  account owner{};
  account to{};
  amount value = 0;

  bool operator==( const transfer_from& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & owner;
    ar & to;
    ar & value;
  }
};

struct burn
{
  account from{};
  amount value = 0;

  bool operator==( const burn& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & value;
  }
};

struct issue
{
  account issuer{};
  amount value = 0;

  bool operator==( const issue& ) const = default;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & issuer;
    ar & value;
  }
};

using event = std::variant< created, transfer, approval, transfer_from, burn, issue >;

std::string_view event_name( const event& e ) noexcept;
std::vector< account > impacted( const event& e );

/**
 * An event as it leaves the host: a sequence number assigned by the sink, the
 * event name, the binary serialized event body and the accounts the event is
 * indexed under.
 */
struct record
{
  std::uint64_t sequence = 0;
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & sequence;
    ar & name;
    ar & data;
    ar & impacted;
  }
};

record make_record( std::uint64_t sequence, const event& e );
result< event > read_event( const record& r );

} // namespace mintage::protocol
