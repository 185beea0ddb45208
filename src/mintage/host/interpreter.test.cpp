// NOLINTBEGIN

#include <gtest/gtest.h>

#include <mintage/host.hpp>
#include <mintage/ledger.hpp>

using mintage::host::host_errc;
using mintage::ledger::ledger_errc;
using mintage::protocol::protocol_errc;

static mintage::protocol::account make_test_account( std::uint8_t id )
{
  mintage::protocol::account acc{};
  acc[ 0 ] = std::byte{ id };
  return acc;
}

class interpreter_test: public ::testing::Test
{
public:
  interpreter_test():
      alice( make_test_account( 1 ) ),
      bob( make_test_account( 2 ) ),
      charlie( make_test_account( 3 ) ),
      ledger( 1'000, alice, sink ),
      interpreter( ledger )
  {}

  std::string a() const
  {
    return mintage::protocol::to_hex( alice );
  }

  std::string b() const
  {
    return mintage::protocol::to_hex( bob );
  }

  std::string c() const
  {
    return mintage::protocol::to_hex( charlie );
  }

  mintage::protocol::account alice;
  mintage::protocol::account bob;
  mintage::protocol::account charlie;
  mintage::host::recorder sink;
  mintage::ledger::ledger ledger;
  mintage::host::interpreter interpreter;
};

TEST_F( interpreter_test, reads )
{
  auto output = interpreter.execute( "total_supply" );
  ASSERT_TRUE( output );
  EXPECT_EQ( *output, "1000" );

  output = interpreter.execute( "balance_of " + a() );
  ASSERT_TRUE( output );
  EXPECT_EQ( *output, "1000" );

  output = interpreter.execute( "balance_of " + b() );
  ASSERT_TRUE( output );
  EXPECT_EQ( *output, "0" );

  output = interpreter.execute( "allowance " + a() + " " + b() );
  ASSERT_TRUE( output );
  EXPECT_EQ( *output, "0" );

  EXPECT_EQ( sink.events().size(), 1 );
}

TEST_F( interpreter_test, mutations )
{
  auto output = interpreter.execute( "transfer " + a() + " " + b() + " 100" );
  ASSERT_TRUE( output );
  EXPECT_TRUE( output->empty() );
  EXPECT_EQ( ledger.balance_of( bob ), 100 );

  output = interpreter.execute( "approve " + a() + " " + b() + " 200" );
  ASSERT_TRUE( output );
  EXPECT_EQ( ledger.allowance( alice, bob ), 200 );

  output = interpreter.execute( "transfer_from " + b() + " " + a() + " " + c() + " 50" );
  ASSERT_TRUE( output );
  EXPECT_EQ( ledger.balance_of( charlie ), 50 );
  EXPECT_EQ( ledger.allowance( alice, bob ), 150 );

  output = interpreter.execute( "burn " + c() + " 25" );
  ASSERT_TRUE( output );
  EXPECT_EQ( ledger.total_supply(), 975 );

  output = interpreter.execute( "issue " + a() + " 25" );
  ASSERT_TRUE( output );
  EXPECT_EQ( ledger.total_supply(), 1'000 );
  EXPECT_EQ( ledger.balance_of( alice ), 725 );

  EXPECT_EQ( sink.events().size(), 6 );
  EXPECT_TRUE( ledger.validate() );
}

TEST_F( interpreter_test, ledger_failures )
{
  auto output = interpreter.execute( "transfer " + b() + " " + a() + " 1" );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), ledger_errc::insufficient_balance );

  output = interpreter.execute( "transfer_from " + c() + " " + a() + " " + c() + " 1" );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), ledger_errc::insufficient_allowance );

  output = interpreter.execute( "issue " + b() + " 1" );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), ledger_errc::not_issuer );

  EXPECT_EQ( sink.events().size(), 1 );
}

TEST_F( interpreter_test, whitespace_and_comments )
{
  auto output = interpreter.execute( "" );
  ASSERT_TRUE( output );
  EXPECT_TRUE( output->empty() );

  output = interpreter.execute( "   # nothing to see here" );
  ASSERT_TRUE( output );
  EXPECT_TRUE( output->empty() );

  output = interpreter.execute( "\ttransfer   " + a() + "  " + b() + "\t7   # pay bob" );
  ASSERT_TRUE( output );
  EXPECT_EQ( ledger.balance_of( bob ), 7 );
}

TEST_F( interpreter_test, parse_errors )
{
  auto output = interpreter.execute( "mint " + a() + " 1" );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), host_errc::unknown_command );
  EXPECT_EQ( output.error().message(), "unknown command" );

  output = interpreter.execute( "transfer " + a() + " 1" );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), host_errc::invalid_arguments );

  output = interpreter.execute( "total_supply " + a() );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), host_errc::invalid_arguments );

  output = interpreter.execute( "transfer 0x01 " + b() + " 1" );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), protocol_errc::invalid_length );

  output = interpreter.execute( "transfer " + a() + " " + b() + " ten" );
  ASSERT_FALSE( output );
  EXPECT_EQ( output.error(), protocol_errc::invalid_amount );

  EXPECT_EQ( ledger.balance_of( alice ), 1'000 );
  EXPECT_EQ( sink.events().size(), 1 );
}

// NOLINTEND
