#include <mintage/host/journal.hpp>

#include <stdexcept>

#include <mintage/log.hpp>

namespace mintage::host {

journal::journal( std::ostream& stream ):
    _stream( &stream ),
    _archive( std::make_unique< boost::archive::binary_oarchive >( stream, archive_flags ) )
{}

void journal::emit( const protocol::event& e )
{
  const auto r = protocol::make_record( _sequence, e );

  *_archive << r;
  _stream->flush();

  if( !*_stream )
    throw std::runtime_error( "failed to write event journal" );

  LOG_INFO( log::instance(), "Event #{} {} ({} bytes)", r.sequence, r.name, r.data.size() );
  _sequence++;
}

std::uint64_t journal::size() const noexcept
{
  return _sequence;
}

} // namespace mintage::host
