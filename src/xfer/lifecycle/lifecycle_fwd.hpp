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

#include "xfer/common.hpp"

/**
 * Flow-Xfer module providing a small orchestrator that starts and stops registered components in phase order.
 *
 * A component is any object offering `start(Error_code*)`, `stop(F&&)` (where `F` is a no-arg callback to be
 * invoked once stopped), `running()`, `auto_startup()` and `phase()`.  session::Session_pool is one such.
 */
namespace xfer::lifecycle
{

// Types.

class Lifecycle_manager;

} // namespace xfer::lifecycle
