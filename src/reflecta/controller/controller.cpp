#include <reflecta/controller/controller.hpp>
#include <reflecta/controller/execution_context.hpp>

#include <reflecta/log.hpp>

#include <memory>

namespace reflecta::controller {

controller::controller() = default;

controller::~controller()
{
  close();
}

void controller::open()
{
  _db.open( {} );
  LOG_INFO( reflecta::log::instance(), "Opened ledger state at revision {}", _db.root()->revision() );
}

void controller::close()
{
  _db.close();
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction )
{
  if( !transaction.validate() )
    return std::unexpected( controller_errc::malformed_transaction );

  auto root = _db.root();

  execution_context context( intent::transaction_application );
  auto transaction_node = root->make_child();
  context.set_state_node( transaction_node );

  auto receipt = context.apply( transaction );
  context.clear_state_node();

  if( !receipt )
  {
    LOG_INFO( reflecta::log::instance(), "Transaction reverted: {}", receipt.error().message() );
    return std::unexpected( receipt.error() );
  }

  transaction_node->squash();
  root->set_revision( root->revision() + 1 );
  receipt->revision = root->revision();

  LOG_DEBUG( reflecta::log::instance(),
             "Transaction applied - Revision: {} [{} operation(s), {} event(s)]",
             receipt->revision,
             transaction.operations.size(),
             receipt->events.size() );

  return receipt;
}

result< protocol::program_output > controller::read_program( const protocol::account& account,
                                                             const protocol::program_input& input ) const
{
  execution_context context( intent::read_only );
  context.set_state_node( _db.root() );

  return context.call_program( account, input.stdin, input.arguments );
}

std::uint64_t controller::revision() const
{
  return _db.root()->revision();
}

} // namespace reflecta::controller
