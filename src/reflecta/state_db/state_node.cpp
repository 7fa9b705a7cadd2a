#include <reflecta/state_db/state_delta.hpp>
#include <reflecta/state_db/state_node.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace reflecta::state_db {

std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( space ) + key.size() );
  std::ranges::copy( memory::as_bytes( space ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return delta()->get( make_compound_key( space, key ) );
}

std::int64_t
state_node::put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value )
{
  return delta()->put( make_compound_key( space, key ), value );
}

std::int64_t state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  return delta()->remove( make_compound_key( space, key ) );
}

std::shared_ptr< temporary_state_node > state_node::make_child()
{
  return std::make_shared< temporary_state_node >( delta()->make_child() );
}

std::uint64_t state_node::revision() const
{
  return delta()->revision();
}

permanent_state_node::permanent_state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

const std::shared_ptr< state_delta >& permanent_state_node::delta() const
{
  return _delta;
}

void permanent_state_node::set_revision( std::uint64_t revision )
{
  _delta->set_revision( revision );
}

temporary_state_node::temporary_state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

const std::shared_ptr< state_delta >& temporary_state_node::delta() const
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  return _delta;
}

void temporary_state_node::squash()
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  _delta->squash();
  _delta.reset();
}

} // namespace reflecta::state_db
