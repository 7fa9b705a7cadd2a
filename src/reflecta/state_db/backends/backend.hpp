#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace reflecta::state_db::backends {

using visitor = std::function< void( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) >;

class abstract_backend
{
public:
  abstract_backend() = default;
  abstract_backend( std::uint64_t revision );
  abstract_backend( const abstract_backend& )            = delete;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = delete;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual std::int64_t put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )           = 0;
  virtual std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const = 0;
  virtual std::int64_t remove( const std::vector< std::byte >& key )                                     = 0;
  virtual void clear()                                                                                   = 0;

  /**
   * Moves every object out of the backend in key order, leaving it empty.
   */
  virtual void drain( const visitor& v ) = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t );

private:
  std::uint64_t _revision = 0;
};

} // namespace reflecta::state_db::backends
