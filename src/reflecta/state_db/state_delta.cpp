#include <reflecta/state_db/state_delta.hpp>

#include <reflecta/state_db/backends/map/map_backend.hpp>

#include <stdexcept>

namespace reflecta::state_db {

state_delta::state_delta() noexcept:
    _backend( std::make_unique< backends::map::map_backend >() )
{}

std::int64_t state_delta::put( std::vector< std::byte >&& key, std::span< const std::byte > value )
{
  if( squashed() )
    throw std::runtime_error( "cannot modify a squashed state delta" );

  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _removed_objects.erase( key );
  _backend->put( std::move( key ), std::vector< std::byte >( value.begin(), value.end() ) );

  return size;
}

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  if( squashed() )
    throw std::runtime_error( "cannot modify a squashed state delta" );

  std::int64_t size = _backend->remove( key );

  if( root() )
    return size;

  // An object inherited from an ancestor is shadowed rather than erased
  if( auto value = _parent->get( key ); value )
  {
    if( !size )
      size -= std::ssize( key ) + std::ssize( *value );

    _removed_objects.emplace( std::move( key ) );
  }

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  if( auto value = _backend->get( key ); value )
    return value;

  if( root() || removed( key ) )
    return {};

  return _parent->get( key );
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash the root state delta" );

  if( squashed() )
    throw std::runtime_error( "state delta has already been squashed" );

  if( _parent->squashed() )
    throw std::runtime_error( "parent state delta has already been squashed" );

  // If an object is removed here and exists in the parent, it needs to only be removed in the parent
  // If an object is modified here, but removed in the parent, it needs to only be modified in the parent
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    _parent->_backend->remove( *itr );

    if( !_parent->root() )
      _parent->_removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  _backend->drain(
    [ this ]( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
    {
      if( !_parent->root() )
        _parent->_removed_objects.erase( key );

      _parent->_backend->put( std::move( key ), std::move( value ) );
    } );

  _squashed = true;
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

bool state_delta::squashed() const
{
  return _squashed;
}

std::uint64_t state_delta::revision() const
{
  return _backend->revision();
}

void state_delta::set_revision( std::uint64_t revision )
{
  _backend->set_revision( revision );
}

std::shared_ptr< state_delta > state_delta::parent() const
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  if( squashed() )
    throw std::runtime_error( "cannot branch from a squashed state delta" );

  auto child      = std::make_shared< state_delta >();
  child->_parent  = shared_from_this();
  child->_backend = std::make_unique< backends::map::map_backend >( revision() );

  return child;
}

} // namespace reflecta::state_db
