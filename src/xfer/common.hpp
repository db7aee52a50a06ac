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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util_fwd.hpp>
#include <flow/util/string_view.hpp>
#include <boost/filesystem.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Catch-all namespace for the Flow-Xfer project: a bounded cache of reusable remote-file-transfer session
 * handles (xfer::session), the inbound remote-to-local synchronization built on top of it (xfer::inbound),
 * and a small phased start/stop orchestrator for such components (xfer::lifecycle).
 *
 * The conventions are those of Flow, on which everything here is built:
 *   - Logging via `flow::log`: stateful objects are `flow::log::Log_context`s, taking a `flow::log::Logger*`
 *     (null allowed: no logging) at construction; see #Log_component.
 *   - Errors via boost.system: a fallible API takes a trailing `Error_code* err_code` which, if null, causes a
 *     `flow::error::Runtime_error` to be thrown instead of the code being emitted into `*err_code`.
 */
namespace xfer
{

// Types.

/**
 * The `flow::log::Component` payload enumeration comprising various log components used by Flow-Xfer's own
 * internal logging.  Internal code should specify it as the `Log_component` argument to `flow::log::Log_context`
 * ctor or FLOW_LOG_SET_CONTEXT().  User code must register it via `flow::log::Config::init_component_names()`
 * (using #S_XFER_LOG_COMPONENT_NAME_MAP) in order for the names to appear in log output.
 */
enum class Log_component
{
  // See the macros file for the actual members; each generates `S_<NAME> = <value>,`.
#define FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
  S_ ## ARG_name_root = ARG_enum_val,
#include "xfer/detail/macros/log_component_enum_declare.macros.hpp"
#undef FLOW_LOG_CFG_COMPONENT_DEFINE
  /// Not an actual value but rather stores the highest numerical payload, useful for validity checks.
  S_END_SENTINEL
}; // enum class Log_component

/// Short-hand for Flow's `Error_code`, which is `boost::system::error_code`.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic function (a-la `std::function<>`).
template<typename Signature>
using Function = flow::Function<Signature>;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for filesystem namespace.
namespace fs = boost::filesystem;

// Globals.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in xfer::Log_component to its
 * string representation as used in log output and verbosity config.  Flow-Xfer user code should pass it to
 * `flow::log::Config::init_component_names()` when configuring their logger(s).
 */
extern const boost::unordered_multimap<Log_component, std::string> S_XFER_LOG_COMPONENT_NAME_MAP;

} // namespace xfer
