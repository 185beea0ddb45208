#pragma once

#include <quill/DeferredFormatCodec.h>

#include <mintage/protocol/account.hpp>
#include <mintage/protocol/amount.hpp>

template<>
struct fmtquill::formatter< mintage::protocol::account >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintage::protocol::account& a, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", mintage::protocol::to_hex( a ) );
  }
};

template<>
struct quill::Codec< mintage::protocol::account >: quill::DeferredFormatCodec< mintage::protocol::account >
{};

template<>
struct fmtquill::formatter< mintage::protocol::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintage::protocol::amount& value, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", mintage::protocol::to_string( value ) );
  }
};

template<>
struct quill::Codec< mintage::protocol::amount >: quill::DeferredFormatCodec< mintage::protocol::amount >
{};
