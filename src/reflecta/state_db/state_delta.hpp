#pragma once

#include <reflecta/state_db/backends/backend.hpp>
#include <reflecta/state_db/types.hpp>

#include <memory>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace reflecta::state_db {

class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  std::shared_ptr< state_delta > _parent;

  std::unique_ptr< backends::abstract_backend > _backend;
  std::set< std::vector< std::byte > > _removed_objects;

  bool _squashed = false;

public:
  state_delta() noexcept;
  state_delta( const state_delta& ) = delete;
  state_delta( state_delta&& )      = delete;
  ~state_delta()                    = default;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;

  std::int64_t put( std::vector< std::byte >&& key, std::span< const std::byte > value );
  std::int64_t remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  void squash();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;
  bool squashed() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

  std::shared_ptr< state_delta > parent() const;
  std::shared_ptr< state_delta > make_child();
};

} // namespace reflecta::state_db
