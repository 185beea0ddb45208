#include <mintage/protocol/event.hpp>

#include <sstream>
#include <utility>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <mintage/memory.hpp>

namespace mintage::protocol {

using namespace std::string_view_literals;

std::string_view event_name( const event& e ) noexcept
{
  if( std::holds_alternative< created >( e ) )
    return "created"sv;
  else if( std::holds_alternative< transfer >( e ) )
    return "transfer"sv;
  else if( std::holds_alternative< approval >( e ) )
    return "approval"sv;
  else if( std::holds_alternative< transfer_from >( e ) )
    return "transfer_from"sv;
  else if( std::holds_alternative< burn >( e ) )
    return "burn"sv;
  else if( std::holds_alternative< issue >( e ) )
    return "issue"sv;

  std::unreachable();
}

std::vector< account > impacted( const event& e )
{
  if( const auto* c = std::get_if< created >( &e ) )
    return { c->from };
  else if( const auto* t = std::get_if< transfer >( &e ) )
    return { t->from, t->to };
  else if( const auto* a = std::get_if< approval >( &e ) )
    return { a->owner, a->spender };
  else if( const auto* tf = std::get_if< transfer_from >( &e ) )
    return { tf->from, tf->owner, tf->to };
  else if( const auto* b = std::get_if< burn >( &e ) )
    return { b->from };
  else if( const auto* i = std::get_if< issue >( &e ) )
    return { i->issuer };

  std::unreachable();
}

record make_record( std::uint64_t sequence, const event& e )
{
  std::stringstream ss;

  {
    boost::archive::binary_oarchive oa( ss, boost::archive::no_header | boost::archive::no_tracking );
    std::visit( [ & ]( const auto& body ) { oa << body; }, e );
  }

  record r;
  r.sequence = sequence;
  r.name     = event_name( e );
  r.impacted = impacted( e );

  const auto bytes = memory::as_bytes( ss.view() );
  r.data.assign( bytes.begin(), bytes.end() );

  return r;
}

template< typename T >
static result< event > decode( const std::vector< std::byte >& data )
{
  std::stringstream ss;
  ss.write( memory::pointer_cast< const char* >( data.data() ), static_cast< std::streamsize >( data.size() ) );

  T body;

  try
  {
    boost::archive::binary_iarchive ia( ss, boost::archive::no_header | boost::archive::no_tracking );
    ia >> body;
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( protocol_errc::invalid_record );
  }

  return body;
}

result< event > read_event( const record& r )
{
  if( r.name == "created"sv )
    return decode< created >( r.data );
  else if( r.name == "transfer"sv )
    return decode< transfer >( r.data );
  else if( r.name == "approval"sv )
    return decode< approval >( r.data );
  else if( r.name == "transfer_from"sv )
    return decode< transfer_from >( r.data );
  else if( r.name == "burn"sv )
    return decode< burn >( r.data );
  else if( r.name == "issue"sv )
    return decode< issue >( r.data );

  return std::unexpected( protocol_errc::unknown_event );
}

} // namespace mintage::protocol
