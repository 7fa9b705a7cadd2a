#pragma once

#include <reflecta/controller/error.hpp>
#include <reflecta/protocol.hpp>
#include <reflecta/state_db.hpp>

#include <cstdint>

namespace reflecta::controller {

/**
 * Applies transactions to the committed state. A transaction runs in a
 * temporary child of the root and is squashed into it only when every
 * program call succeeds; otherwise the root is left untouched and the
 * failing program's error is returned.
 */
class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  void open();
  void close();

  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

  result< protocol::program_output > read_program( const protocol::account& account,
                                                   const protocol::program_input& input = {} ) const;

  std::uint64_t revision() const;

private:
  state_db::database _db;
};

} // namespace reflecta::controller
