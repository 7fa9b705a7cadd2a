#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>

#include <reflecta/protocol/account.hpp>

namespace reflecta::state_db {

class state_node;
class permanent_state_node;
class temporary_state_node;
class state_delta;

constexpr std::size_t object_space_padding_size = 2;

/**
 * Objects are namespaced by the owning account and a program chosen id.
 * The layout has no implicit padding so it can be used directly as a key
 * prefix.
 */
struct object_space
{
  bool system = false;
  std::array< std::uint8_t, object_space_padding_size > padding{};
  protocol::account_bytes address{};
  std::uint32_t id = 0;
};

static_assert( sizeof( object_space )
               == sizeof( bool ) + object_space_padding_size + protocol::account_length + sizeof( std::uint32_t ) );

using state_node_ptr           = std::shared_ptr< state_node >;
using permanent_state_node_ptr = std::shared_ptr< permanent_state_node >;
using temporary_state_node_ptr = std::shared_ptr< temporary_state_node >;
using genesis_init_function    = std::function< void( const state_node_ptr& ) >;

} // namespace reflecta::state_db
