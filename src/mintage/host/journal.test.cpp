// NOLINTBEGIN

#include <sstream>

#include <boost/archive/binary_iarchive.hpp>
#include <gtest/gtest.h>

#include <mintage/host/journal.hpp>
#include <mintage/host/recorder.hpp>
#include <mintage/ledger.hpp>

static mintage::protocol::account make_test_account( std::uint8_t id )
{
  mintage::protocol::account acc{};
  acc[ 0 ] = std::byte{ id };
  return acc;
}

TEST( journal, records )
{
  const auto alice = make_test_account( 1 );
  const auto bob   = make_test_account( 2 );

  std::stringstream stream;

  {
    mintage::host::journal journal( stream );
    mintage::ledger::ledger ledger( 1'000, alice, journal );

    EXPECT_EQ( ledger.transfer( alice, bob, 100 ), mintage::ledger::ledger_errc::ok );
    EXPECT_EQ( ledger.burn( bob, 500 ), mintage::ledger::ledger_errc::insufficient_balance );
    EXPECT_EQ( ledger.burn( bob, 50 ), mintage::ledger::ledger_errc::ok );
    EXPECT_EQ( journal.size(), 3 );
  }

  boost::archive::binary_iarchive ia( stream, mintage::host::journal::archive_flags );

  std::vector< mintage::protocol::event > expected{
    mintage::protocol::created{ alice, 1'000 },
    mintage::protocol::transfer{ alice, bob, 100 },
    mintage::protocol::burn{ bob, 50 }
  };

  for( std::uint64_t i = 0; i < expected.size(); i++ )
  {
    mintage::protocol::record r;
    ia >> r;

    EXPECT_EQ( r.sequence, i );
    EXPECT_EQ( r.name, mintage::protocol::event_name( expected[ i ] ) );
    EXPECT_EQ( r.impacted, mintage::protocol::impacted( expected[ i ] ) );

    auto e = mintage::protocol::read_event( r );
    ASSERT_TRUE( e );
    EXPECT_EQ( *e, expected[ i ] );
  }
}

TEST( recorder, clear )
{
  mintage::host::recorder recorder;
  mintage::ledger::ledger ledger( 10, make_test_account( 1 ), recorder );

  ASSERT_EQ( recorder.events().size(), 1 );
  recorder.clear();
  EXPECT_TRUE( recorder.events().empty() );

  EXPECT_EQ( ledger.burn( make_test_account( 1 ), 10 ), mintage::ledger::ledger_errc::ok );
  EXPECT_EQ( recorder.events().size(), 1 );
}

// NOLINTEND
