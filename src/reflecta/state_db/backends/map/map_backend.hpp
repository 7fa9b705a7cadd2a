#pragma once

#include <reflecta/state_db/backends/backend.hpp>

#include <map>
#include <vector>

namespace reflecta::state_db::backends::map {

using map_type = std::map< std::vector< std::byte >, std::vector< std::byte > >;

class map_backend final: public abstract_backend
{
public:
  map_backend() = default;
  map_backend( std::uint64_t revision );
  map_backend( const map_backend& )            = delete;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = delete;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() override                      = default;

  std::int64_t put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) override;
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const override;
  std::int64_t remove( const std::vector< std::byte >& key ) override;
  void clear() noexcept override;

  void drain( const visitor& v ) override;

  std::uint64_t size() const noexcept override;

private:
  map_type _map;
};

} // namespace reflecta::state_db::backends::map
