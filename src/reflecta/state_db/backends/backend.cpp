#include <reflecta/state_db/backends/backend.hpp>

namespace reflecta::state_db::backends {

abstract_backend::abstract_backend( std::uint64_t revision ):
    _revision( revision )
{}

bool abstract_backend::empty() const
{
  return size() == 0;
}

std::uint64_t abstract_backend::revision() const
{
  return _revision;
}

void abstract_backend::set_revision( std::uint64_t revision )
{
  _revision = revision;
}

} // namespace reflecta::state_db::backends
