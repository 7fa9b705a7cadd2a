#pragma once

#include <reflecta/state_db/state_node.hpp>

namespace reflecta::state_db {

/**
 * database owns the committed root of the state tree.
 *
 * Writers never touch the root directly. They create a temporary child,
 * write into it (creating nested children for sub-operations that may
 * fail) and squash it into the root once every step has succeeded. A child
 * that is dropped without being squashed leaves the root untouched.
 *
 * database is not thread safe. Writes on a single state node need to be
 * serialized.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database, running init against the empty root.
   */
  void open( const genesis_init_function& init );

  /**
   * Close the database.
   */
  void close();

  /**
   * Returns whether the database is open.
   */
  bool is_open() const noexcept;

  /**
   * Get and return the current "root" node.
   */
  permanent_state_node_ptr root() const;

private:
  permanent_state_node_ptr _root;
};

} // namespace reflecta::state_db
