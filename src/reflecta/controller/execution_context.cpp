#include <algorithm>
#include <expected>
#include <stdexcept>
#include <string>

#include <boost/endian.hpp>
#include <boost/locale/utf.hpp>

#include <reflecta/controller/execution_context.hpp>
#include <reflecta/memory.hpp>

namespace reflecta::controller {

const program_registry_map execution_context::program_registry = []()
{
  program_registry_map registry;
  registry.emplace( protocol::system_program( "token" ), std::make_unique< program::token >() );
  registry.emplace( protocol::system_program( "treasury" ), std::make_unique< program::treasury >() );
  return registry;
}();

constexpr auto event_name_limit = 128;

template< typename T >
bool validate_utf( std::basic_string_view< T > str )
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< T >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

execution_context::execution_context( intent i ):
    _intent( i )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::clear_state_node()
{
  _state_node.reset();
}

result< protocol::transaction_receipt > execution_context::apply( const protocol::transaction& transaction )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return std::unexpected( reversion_errc::read_only_context );

  _transaction = &transaction;

  for( const auto& o: transaction.operations )
  {
    if( auto error = apply( o ); error )
    {
      _transaction = nullptr;
      return std::unexpected( error );
    }
  }

  _transaction = nullptr;

  protocol::transaction_receipt receipt;
  receipt.revision = _state_node->revision();
  receipt.frames   = _frames;
  receipt.events   = _events;
  receipt.logs     = _logs;

  return receipt;
}

std::error_code execution_context::apply( const protocol::call_program& op )
{
  auto result = call_program( op.id, op.input.stdin, op.input.arguments );

  if( !result )
    return result.error();

  return controller_errc::ok;
}

std::span< const std::string > execution_context::arguments()
{
  return _stack.peek_frame().arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    auto& output = _stack.peek_frame().stdout;
    output.insert( output.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    auto& error = _stack.peek_frame().stderr;
    error.insert( error.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return reversion_errc::bad_file_descriptor;

  auto& frame = _stack.peek_frame();
  if( frame.stdin.size() - frame.stdin_offset < buffer.size() )
    return reversion_errc::insufficient_input;

  std::ranges::copy( frame.stdin.subspan( frame.stdin_offset, buffer.size() ), buffer.begin() );
  frame.stdin_offset += buffer.size();
  return reversion_errc::ok;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id )
{
  state_db::object_space space{ .system = false, .id = id };
  std::ranges::copy( _stack.peek_frame().program_id, space.address.begin() );

  return space;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->remove( create_object_space( id ), key );
  return reversion_errc::ok;
}

void execution_context::log( std::string_view message )
{
  _logs.emplace_back( message );
}

std::error_code execution_context::event( std::string_view name,
                                          std::span< const std::byte > data,
                                          const std::vector< protocol::account >& impacted )
{
  if( name.size() == 0 )
    return reversion_errc::invalid_event_name;

  if( name.size() > event_name_limit )
    return reversion_errc::invalid_event_name;

  if( !validate_utf( name ) )
    return reversion_errc::invalid_event_name;

  if( std::ranges::any_of( impacted,
                           []( const protocol::account& account )
                           {
                             return account.type() == protocol::account_type::invalid;
                           } ) )
    return reversion_errc::invalid_account;

  protocol::event event;
  event.sequence = static_cast< std::uint32_t >( _events.size() );
  event.source   = _stack.peek_frame().program_id;
  event.name     = std::string( name );
  event.data     = std::vector( data.begin(), data.end() );
  event.impacted = impacted;

  _events.emplace_back( std::move( event ) );

  return reversion_errc::ok;
}

result< bool > execution_context::check_authority( protocol::account_view account )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return std::unexpected( reversion_errc::read_only_context );

  if( account.program() )
  {
    auto selector = boost::endian::native_to_little( program::entry_point::authorize );

    return call_program( account, memory::as_bytes( selector ) )
      .and_then(
        []( auto&& output ) -> result< bool >
        {
          if( output.stdout.size() != sizeof( bool ) )
            return std::unexpected( reversion_errc::failure );

          return output.stdout.front() == std::byte{ 0x01 };
        } );
  }

  if( !account.user() )
    return std::unexpected( reversion_errc::invalid_account );

  if( _transaction == nullptr )
    throw std::runtime_error( "transaction required for check authority" );

  return std::ranges::any_of( _transaction->signers,
                              [ & ]( const protocol::account& signer )
                              {
                                return std::ranges::equal( signer, account );
                              } );
}

std::span< const std::byte > execution_context::get_caller()
{
  if( const auto* caller = _stack.caller(); caller )
    return *caller;

  return std::span< const std::byte >{};
}

std::span< const std::byte > execution_context::get_program_id()
{
  return _stack.peek_frame().program_id;
}

result< protocol::program_output > execution_context::call_program( protocol::account_view account,
                                                                    std::span< const std::byte > stdin,
                                                                    std::span< const std::string > arguments )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( !account.program() )
    return std::unexpected( reversion_errc::invalid_program );

  auto id         = protocol::make_account( account );
  auto registered = program_registry.find( id );
  if( registered == program_registry.end() )
    return std::unexpected( reversion_errc::invalid_program );

  if( auto error = _stack.push_frame( { .program_id = id, .arguments = arguments, .stdin = stdin } ); error )
    return std::unexpected( error );

  frame_guard guard( _stack );

  auto caller_node  = _state_node;
  auto call_node    = caller_node->make_child();
  auto event_mark   = _events.size();
  auto log_mark     = _logs.size();
  auto frame_mark   = _frames.size();
  auto depth        = static_cast< std::uint32_t >( _stack.size() );

  _state_node = call_node;
  auto code   = registered->second->run( this, arguments );
  _state_node = caller_node;

  if( code )
  {
    _events.resize( event_mark );
    _logs.resize( log_mark );
    _frames.resize( frame_mark );
    return std::unexpected( code );
  }

  call_node->squash();

  auto frame       = std::make_shared< protocol::program_frame >();
  frame->id        = id;
  frame->depth     = depth;
  frame->arguments = std::vector( arguments.begin(), arguments.end() );
  frame->stdin     = std::vector( stdin.begin(), stdin.end() );
  frame->stdout    = std::move( _stack.peek_frame().stdout );
  frame->stderr    = std::move( _stack.peek_frame().stderr );
  _frames.insert( _frames.begin() + static_cast< std::ptrdiff_t >( frame_mark ), frame );

  protocol::program_output output;
  output.stdout = frame->stdout;
  output.stderr = frame->stderr;
  return output;
}

const std::vector< protocol::event >& execution_context::events() const noexcept
{
  return _events;
}

const std::vector< std::string >& execution_context::logs() const noexcept
{
  return _logs;
}

} // namespace reflecta::controller
