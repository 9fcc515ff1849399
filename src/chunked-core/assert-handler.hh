#pragma once

#include <chunked-core/assert.hh>

#include <functional>
#include <string>

namespace ck::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = ck::impl::scoped_assertion_handler([](ck::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw assertion_failure_exception{info.message};
//       });
//
//       risky_operation(); // assertions in here use the custom handler
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    ck::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

// Push a custom assertion handler onto the handler stack
// Handlers are allowed to throw to unwind to some recovery point
void push_assertion_handler(assertion_handler handler);

// Pop the topmost assertion handler from the stack
// NOTE: prefer scoped_assertion_handler so throwing handlers cannot unbalance the stack
void pop_assertion_handler();

// Number of handlers currently on the stack
[[nodiscard]] int assertion_handler_count();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ck::impl
