#pragma once

#include <reflecta/memory.hpp>
#include <reflecta/state_db/types.hpp>

#include <optional>
#include <span>
#include <vector>

namespace reflecta::state_db {

std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key );

class state_node
{
public:
  state_node() noexcept                = default;
  state_node( const state_node& node ) = delete;
  state_node( state_node&& node )      = delete;
  virtual ~state_node()                = default;

  state_node& operator=( const state_node& node ) = delete;
  state_node& operator=( state_node&& node )      = delete;

  /**
   * Fetch an object if one exists.
   */
  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;

  /**
   * Write an object into the state_node. Returns the change in stored bytes.
   */
  std::int64_t put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value );

  /**
   * Remove an object from the state_node. Returns the change in stored bytes.
   */
  std::int64_t remove( const object_space& space, std::span< const std::byte > key );

  /**
   * Returns a temporary child state node with this node as its parent.
   */
  std::shared_ptr< temporary_state_node > make_child();

  /**
   * Returns the revision of the state node.
   */
  std::uint64_t revision() const;

protected:
  virtual const std::shared_ptr< state_delta >& delta() const = 0;
};

/**
 * The root of the state tree. All committed state lives here.
 */
class permanent_state_node final: public state_node
{
public:
  permanent_state_node( const std::shared_ptr< state_delta >& delta ) noexcept;
  permanent_state_node( const permanent_state_node& node ) = delete;
  permanent_state_node( permanent_state_node&& node )      = delete;
  ~permanent_state_node() override                         = default;

  permanent_state_node& operator=( const permanent_state_node& node ) = delete;
  permanent_state_node& operator=( permanent_state_node&& node )      = delete;

  void set_revision( std::uint64_t revision );

private:
  const std::shared_ptr< state_delta >& delta() const override;

  std::shared_ptr< state_delta > _delta;
};

class temporary_state_node final: public state_node
{
public:
  temporary_state_node( const std::shared_ptr< state_delta >& delta ) noexcept;
  temporary_state_node( const temporary_state_node& ) = delete;
  temporary_state_node( temporary_state_node&& )      = delete;
  ~temporary_state_node() override                    = default;

  temporary_state_node& operator=( const temporary_state_node& ) = delete;
  temporary_state_node& operator=( temporary_state_node&& )      = delete;

  /**
   * Squash the node in to the parent node. This call invalidates this state node.
   */
  void squash();

private:
  const std::shared_ptr< state_delta >& delta() const override;

  std::shared_ptr< state_delta > _delta;
};

} // namespace reflecta::state_db
