#include <reflecta/controller/call_stack.hpp>

#include <stdexcept>
#include <utility>

namespace reflecta::controller {

call_stack::call_stack( std::size_t stack_limit ):
    _stack(),
    _limit( stack_limit )
{}

std::error_code call_stack::push_frame( stack_frame&& f ) noexcept
{
  if( _stack.size() >= _limit )
    return reversion_errc::stack_overflow;

  _stack.emplace_back( std::move( f ) );

  return reversion_errc::ok;
}

stack_frame& call_stack::peek_frame( std::size_t depth )
{
  if( depth >= _stack.size() )
    throw std::runtime_error( "stack is too shallow" );

  return *( _stack.rbegin() + static_cast< std::ptrdiff_t >( depth ) );
}

stack_frame call_stack::pop_frame()
{
  if( _stack.size() == 0 )
    throw std::runtime_error( "stack is empty" );

  stack_frame frame = std::move( *_stack.rbegin() );
  _stack.pop_back();

  return frame;
}

std::size_t call_stack::size() const
{
  return _stack.size();
}

const protocol::account* call_stack::caller() const noexcept
{
  if( _stack.size() < 2 )
    return nullptr;

  return &( _stack.rbegin() + 1 )->program_id;
}

} // namespace reflecta::controller
