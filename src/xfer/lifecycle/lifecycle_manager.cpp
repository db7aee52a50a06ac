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
#include "xfer/lifecycle/lifecycle_manager.hpp"
#include <flow/error/error.hpp>
#include <boost/thread/future.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>
#include <exception>

namespace xfer::lifecycle
{

// Static initializations.

const Lifecycle_manager::Stop_timeout Lifecycle_manager::S_DEFAULT_STOP_TIMEOUT = boost::chrono::seconds(30);

// Implementations.

Lifecycle_manager::Lifecycle_manager(flow::log::Logger* logger_ptr, Stop_timeout stop_timeout) :
  flow::log::Log_context(logger_ptr, Log_component::S_LIFECYCLE),
  m_stop_timeout(stop_timeout),
  m_running(false)
{
  FLOW_LOG_INFO("Lifecycle manager [" << this << "]: Created; stop timeout [" << m_stop_timeout << "] per phase.");
}

void Lifecycle_manager::add_component(Component&& component)
{
  Lock_guard lock(m_mutex);

  FLOW_LOG_INFO("Lifecycle manager [" << this << "]: Registered component [" << component.m_name << "] "
                "(phase [" << component.m_phase << "], auto-startup [" << component.m_auto_startup << "]).");
  m_components.emplace_back(std::move(component));
}

std::vector<Lifecycle_manager::Component*> Lifecycle_manager::components_by_phase()
{
  std::vector<Component*> sorted;
  sorted.reserve(m_components.size());
  for (auto& component : m_components)
  {
    sorted.push_back(&component);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Component* a, const Component* b) { return a->m_phase < b->m_phase; });
  return sorted;
}

void Lifecycle_manager::start_all(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start_all(actual_err_code); },
         err_code, "Lifecycle_manager::start_all()"))
  {
    return;
  }
  // else

  Lock_guard lock(m_mutex);

  FLOW_LOG_INFO("Lifecycle manager [" << this << "]: Starting auto-startup components.");
  err_code->clear();

  for (auto component : components_by_phase())
  {
    if ((!component->m_auto_startup) || component->m_running_func())
    {
      continue;
    }
    // else

    FLOW_LOG_INFO("Lifecycle manager [" << this << "]: Starting component [" << component->m_name << "] "
                  "in phase [" << component->m_phase << "].");
    component->m_start_func(err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Lifecycle manager [" << this << "]: Component [" << component->m_name << "] failed to "
                       "start; error [" << *err_code << "] [" << err_code->message() << "].  Aborting start.");
      return;
    }
  } // for (component : components_by_phase())

  m_running = true;
  FLOW_LOG_INFO("Lifecycle manager [" << this << "]: All auto-startup components started.");
} // Lifecycle_manager::start_all()

void Lifecycle_manager::stop_all()
{
  using boost::promise;
  using boost::shared_ptr;
  using boost::make_shared;
  using boost::future_status;
  using Clock = boost::chrono::steady_clock;
  using Promise_ptr = shared_ptr<promise<void>>;
  using std::exception;

  Lock_guard lock(m_mutex);

  FLOW_LOG_INFO("Lifecycle manager [" << this << "]: Stopping running components.");
  m_running = false;

  auto sorted = components_by_phase();
  std::reverse(sorted.begin(), sorted.end());

  auto phase_begin = sorted.begin();
  while (phase_begin != sorted.end())
  {
    const int phase = (*phase_begin)->m_phase;
    const auto phase_end = std::find_if(phase_begin, sorted.end(),
                                        [&](const Component* component) { return component->m_phase != phase; });

    // Issue all the stop()s of this phase; then await them collectively.
    std::vector<std::pair<Component*, Promise_ptr>> pending;
    for (auto component_it = phase_begin; component_it != phase_end; ++component_it)
    {
      const auto component = *component_it;
      if (!component->m_running_func())
      {
        continue;
      }
      // else

      /* The promise is co-owned by the callback, since it may fire after we've given up on it (and returned).
       * Likewise it must not touch `this` or `component`. */
      auto done_promise = make_shared<promise<void>>();
      pending.emplace_back(component, done_promise);

      FLOW_LOG_INFO("Lifecycle manager [" << this << "]: Stopping component [" << component->m_name << "] "
                    "in phase [" << phase << "].");
      try
      {
        component->m_stop_func([done_promise]() { done_promise->set_value(); });
      }
      catch (const exception& exc)
      {
        FLOW_LOG_WARNING("Lifecycle manager [" << this << "]: Component [" << component->m_name << "] threw "
                         "[" << exc.what() << "] while stopping; not waiting for it; proceeding.");
        pending.pop_back();
      }
      catch (...)
      {
        FLOW_LOG_WARNING("Lifecycle manager [" << this << "]: Component [" << component->m_name << "] threw "
                         "a non-std exception while stopping; not waiting for it; proceeding.");
        pending.pop_back();
      }
    }

    const auto deadline = Clock::now() + m_stop_timeout;
    for (const auto& component_and_promise : pending)
    {
      auto done_future = component_and_promise.second->get_future();
      if (done_future.wait_until(deadline) == future_status::timeout)
      {
        FLOW_LOG_WARNING("Lifecycle manager [" << this << "]: Component [" << component_and_promise.first->m_name
                         << "] did not finish stopping within [" << m_stop_timeout << "]; proceeding anyway.");
      }
    }

    phase_begin = phase_end;
  } // while (phase_begin != sorted.end())

  FLOW_LOG_INFO("Lifecycle manager [" << this << "]: Stop finished.");
} // Lifecycle_manager::stop_all()

bool Lifecycle_manager::running() const
{
  Lock_guard lock(m_mutex);
  return m_running;
}

Lifecycle_manager::Stop_timeout Lifecycle_manager::stop_timeout() const
{
  return m_stop_timeout;
}

size_t Lifecycle_manager::component_count() const
{
  Lock_guard lock(m_mutex);
  return m_components.size();
}

} // namespace xfer::lifecycle
