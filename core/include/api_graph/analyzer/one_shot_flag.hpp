// api_graph/analyzer/one_shot_flag.hpp - Monotonic false -> true state
//
#pragma once

#include <string>
#include <string_view>

#include "api_graph/basic/error.hpp"

namespace api_graph
{

/**
 * A flag that may be raised exactly once and never lowered.
 *
 * Raising it a second time is an InternalError: callers are expected to test
 * is_set() before transitioning.
 */
class OneShotFlag
{
public:
  OneShotFlag() = default;

  [[nodiscard]] bool is_set() const noexcept { return set_; }

  /**
   * Raise the flag.
   *
   * @param what Description of the state for the error message
   */
  void set(std::string_view what)
  {
    if (set_) {
      throw InternalError(
        error_code::k_state_transition, std::string(what) + " was already set");
    }
    set_ = true;
  }

private:
  bool set_ = false;
};

}  // namespace api_graph
