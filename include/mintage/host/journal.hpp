#pragma once

#include <cstdint>
#include <memory>
#include <ostream>

#include <boost/archive/binary_oarchive.hpp>

#include <mintage/ledger/event_sink.hpp>

namespace mintage::host {

/**
 * Appends each emitted event to a binary stream as a protocol::record.
 *
 * Records are numbered from zero in emission order and written through a
 * single boost binary archive, so a journal is read back with one
 * boost::archive::binary_iarchive constructed with the same flags.
 */
struct journal final: public ledger::event_sink
{
  static constexpr unsigned int archive_flags = boost::archive::no_tracking;

  explicit journal( std::ostream& stream );
  journal( const journal& ) = delete;
  journal( journal&& )      = delete;
  ~journal() override       = default;

  journal& operator=( const journal& ) = delete;
  journal& operator=( journal&& )      = delete;

  void emit( const protocol::event& e ) override;

  std::uint64_t size() const noexcept;

private:
  std::ostream* _stream;
  std::unique_ptr< boost::archive::binary_oarchive > _archive;
  std::uint64_t _sequence = 0;
};

} // namespace mintage::host
