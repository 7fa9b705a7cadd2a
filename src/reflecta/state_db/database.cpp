#include <reflecta/state_db/database.hpp>
#include <reflecta/state_db/state_delta.hpp>

#include <stdexcept>

namespace reflecta::state_db {

database::database() noexcept = default;

database::~database()
{
  close();
}

void database::open( const genesis_init_function& init )
{
  if( _root )
    throw std::runtime_error( "database is already open" );

  auto root = std::make_shared< permanent_state_node >( std::make_shared< state_delta >() );

  if( init )
    init( root );

  _root = root;
}

void database::close()
{
  _root.reset();
}

bool database::is_open() const noexcept
{
  return static_cast< bool >( _root );
}

permanent_state_node_ptr database::root() const
{
  if( !_root )
    throw std::runtime_error( "database is not open" );

  return _root;
}

} // namespace reflecta::state_db
