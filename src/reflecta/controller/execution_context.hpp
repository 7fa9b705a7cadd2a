#pragma once

#include <reflecta/controller/call_stack.hpp>
#include <reflecta/controller/error.hpp>
#include <reflecta/program.hpp>
#include <reflecta/protocol.hpp>
#include <reflecta/state_db.hpp>

#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace reflecta::controller {

using program_registry_map = std::map< protocol::account, std::unique_ptr< program::program > >;

enum class intent : std::uint8_t
{
  read_only,
  transaction_application
};

/**
 * Hosts the programs invoked by a single transaction or query. Every
 * program call runs in a child of the caller's state node and is squashed
 * into it only when the call succeeds, so a failed sub-call leaves no
 * trace in state or in the recorded events.
 */
class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  explicit execution_context( intent i );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );
  void clear_state_node();

  result< protocol::transaction_receipt > apply( const protocol::transaction& );

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  void log( std::string_view message ) final;

  std::error_code event( std::string_view name,
                         std::span< const std::byte > data,
                         const std::vector< protocol::account >& impacted = {} ) final;

  result< bool > check_authority( protocol::account_view account ) final;

  std::span< const std::byte > get_caller() final;
  std::span< const std::byte > get_program_id() final;

  result< protocol::program_output > call_program( protocol::account_view account,
                                                   std::span< const std::byte > stdin,
                                                   std::span< const std::string > arguments = {} ) final;

  const std::vector< protocol::event >& events() const noexcept;
  const std::vector< std::string >& logs() const noexcept;

private:
  std::error_code apply( const protocol::call_program& );

  state_db::object_space create_object_space( std::uint32_t id );

  state_db::state_node_ptr _state_node;
  call_stack _stack;

  const protocol::transaction* _transaction = nullptr;
  intent _intent;

  std::vector< protocol::event > _events;
  std::vector< std::string > _logs;
  std::vector< std::shared_ptr< protocol::program_frame > > _frames;

  static const program_registry_map program_registry;
};

} // namespace reflecta::controller
