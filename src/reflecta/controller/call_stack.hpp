#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <reflecta/controller/error.hpp>
#include <reflecta/protocol/account.hpp>

namespace reflecta::controller {

struct stack_frame final
{
  protocol::account program_id{};
  std::span< const std::string > arguments;
  std::span< const std::byte > stdin;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;

  std::size_t stdin_offset = 0;
};

class call_stack final
{
public:
  static constexpr std::size_t max_call_depth = 32;

  call_stack( std::size_t stack_limit = max_call_depth );

  std::error_code push_frame( stack_frame&& f ) noexcept;

  /**
   * Returns the frame depth levels below the top of the stack.
   */
  stack_frame& peek_frame( std::size_t depth = 0 );
  stack_frame pop_frame();
  std::size_t size() const;

  /**
   * The program one frame below the top. Calls made directly by a
   * transaction operation have no caller and yield nullptr.
   */
  const protocol::account* caller() const noexcept;

private:
  std::vector< stack_frame > _stack;
  std::size_t _limit;
};

struct frame_guard final
{
  frame_guard( const frame_guard& )            = delete;
  frame_guard( frame_guard&& )                 = delete;
  frame_guard& operator=( const frame_guard& ) = delete;
  frame_guard& operator=( frame_guard&& )      = delete;

  frame_guard( call_stack& stack ):
      _call_stack( &stack )
  {}

  ~frame_guard()
  {
    _call_stack->pop_frame();
  }

private:
  call_stack* _call_stack;
};

} // namespace reflecta::controller
