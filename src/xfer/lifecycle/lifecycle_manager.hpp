/* Flow-Xfer: Remote file-transfer session pooling
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "xfer/lifecycle/lifecycle_fwd.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util_fwd.hpp>
#include <boost/chrono/chrono.hpp>
#include <boost/noncopyable.hpp>
#include <cassert>
#include <string>
#include <vector>

namespace xfer::lifecycle
{

// Types.

/**
 * Starts and stops a set of registered components in order of their `phase()`: start_all() in ascending order,
 * stop_all() in descending order.  Components sharing a phase are started in registration order and stopped in
 * reverse registration order.
 *
 * start_all() only considers components whose `auto_startup()` is `true` and which are not already `running()`;
 * the first failure aborts it (components started earlier remain running; stop_all() will take care of them).
 *
 * stop_all() only considers components that are `running()`.  Within a phase it issues every `stop()` first and
 * only then awaits the stop callbacks, for at most stop_timeout() per phase; then it proceeds to the next phase
 * regardless.  A `stop()` that throws is logged and not waited for; the remaining components are still stopped.
 *
 * ### Thread safety ###
 * All methods may be invoked concurrently; start_all() and stop_all() are serialized against each other.
 * Registered components must outlive `*this`.
 */
class Lifecycle_manager :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Duration type for stop_timeout().
  using Stop_timeout = boost::chrono::milliseconds;

  // Constants.

  /// Default for stop_timeout().
  static const Stop_timeout S_DEFAULT_STOP_TIMEOUT;

  // Constructors/destructor.

  /**
   * Constructs an empty manager.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param stop_timeout
   *        See stop_timeout().
   */
  explicit Lifecycle_manager(flow::log::Logger* logger_ptr, Stop_timeout stop_timeout = S_DEFAULT_STOP_TIMEOUT);

  // Methods.

  /**
   * Registers a component.  Its `auto_startup()` and `phase()` are read now and not again.
   *
   * @tparam Lifecycle_obj
   *         See namespace doc header.
   * @param name
   *         Name for logging.
   * @param obj
   *        The component.  Must not be null.
   */
  template<typename Lifecycle_obj>
  void register_component(String_view name, Lifecycle_obj* obj);

  /**
   * Starts auto-startup components; see class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever the failing component's `start()` emits.
   */
  void start_all(Error_code* err_code = 0);

  /// Stops running components; see class doc header.  Blocks for up to stop_timeout() per phase.
  void stop_all();

  /**
   * Whether start_all() has succeeded more recently than stop_all() was invoked.
   *
   * @return See above.
   */
  bool running() const;

  /**
   * How long stop_all() waits for the components of one phase to report being stopped.
   *
   * @return See above.
   */
  Stop_timeout stop_timeout() const;

  /**
   * Number of registered components.
   *
   * @return See above.
   */
  size_t component_count() const;

private:
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// A registered component, type-erased.
  struct Component
  {
    /// See register_component().
    std::string m_name;
    /// Invokes `start(err_code)`.
    Function<void (Error_code*)> m_start_func;
    /// Invokes `stop(on_stopped_func)`.
    Function<void (Function<void ()>&&)> m_stop_func;
    /// Invokes `running()`.
    Function<bool ()> m_running_func;
    /// `auto_startup()` at registration.
    bool m_auto_startup;
    /// `phase()` at registration.
    int m_phase;
  };

  // Methods.

  /**
   * Helper of register_component() that does the non-template work.
   *
   * @param component
   *        The component.
   */
  void add_component(Component&& component);

  /**
   * Returns pointers into #m_components sorted by ascending phase, preserving registration order within a phase.
   * #m_mutex must be locked.
   *
   * @return See above.
   */
  std::vector<Component*> components_by_phase();

  // Data.

  /// See stop_timeout().
  const Stop_timeout m_stop_timeout;

  /// Protects the following, and serializes start_all() against stop_all().
  mutable Mutex m_mutex;

  /// Registered components in registration order.
  std::vector<Component> m_components;

  /// See running().
  bool m_running;
}; // class Lifecycle_manager

// Template implementations.

template<typename Lifecycle_obj>
void Lifecycle_manager::register_component(String_view name, Lifecycle_obj* obj)
{
  assert(obj);

  add_component(Component{ std::string(name),
                           [obj](Error_code* err_code) { obj->start(err_code); },
                           [obj](Function<void ()>&& on_stopped_func) { obj->stop(std::move(on_stopped_func)); },
                           [obj]() -> bool { return obj->running(); },
                           obj->auto_startup(), obj->phase() });
}

} // namespace xfer::lifecycle
