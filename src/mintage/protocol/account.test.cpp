#include <unordered_set>

#include <gtest/gtest.h>

#include <mintage/protocol/account.hpp>

using namespace std::string_literals;

constexpr auto alice_hex = "0x0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20";

TEST( account, hex )
{
  auto alice = mintage::protocol::account_from_hex( alice_hex );
  ASSERT_TRUE( alice );

  for( std::size_t i = 0; i < alice->size(); i++ )
    EXPECT_EQ( std::to_integer< std::size_t >( alice->at( i ) ), i + 1 );

  EXPECT_EQ( mintage::protocol::to_hex( *alice ), alice_hex );

  auto unprefixed = mintage::protocol::account_from_hex( std::string( alice_hex ).substr( 2 ) );
  ASSERT_TRUE( unprefixed );
  EXPECT_EQ( *unprefixed, *alice );

  auto upper = mintage::protocol::account_from_hex(
    "0X0102030405060708090A0B0C0D0E0F101112131415161718191A1B1C1D1E1F20"s );
  ASSERT_TRUE( upper );
  EXPECT_EQ( *upper, *alice );
}

TEST( account, invalid_hex )
{
  auto short_account = mintage::protocol::account_from_hex( "0x0102" );
  if( short_account )
    ADD_FAILURE() << "account parse erroneously succeeded";
  else
    EXPECT_EQ( short_account.error(), mintage::protocol::protocol_errc::invalid_length );

  std::string bad_character( alice_hex );
  bad_character[ 10 ] = 'g';

  auto bad_account = mintage::protocol::account_from_hex( bad_character );
  if( bad_account )
    ADD_FAILURE() << "account parse erroneously succeeded";
  else
  {
    EXPECT_EQ( bad_account.error(), mintage::protocol::protocol_errc::invalid_character );
    EXPECT_EQ( bad_account.error().message(), "invalid character" );
  }

  EXPECT_FALSE( mintage::protocol::account_from_hex( "" ) );
}

TEST( account, hash )
{
  mintage::protocol::account a{};
  mintage::protocol::account b{};
  b[ 31 ] = std::byte{ 0x01 };

  mintage::protocol::account_hash hasher;
  EXPECT_EQ( hasher( a ), hasher( mintage::protocol::account{} ) );
  EXPECT_NE( hasher( a ), hasher( b ) );
  EXPECT_NE( hasher( mintage::protocol::account_pair{ a, b } ), hasher( mintage::protocol::account_pair{ b, a } ) );

  std::unordered_set< mintage::protocol::account > accounts{ a, b, a };
  EXPECT_EQ( accounts.size(), 2 );
}
