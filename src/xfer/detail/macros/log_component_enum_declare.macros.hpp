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

// Intentionally no #pragma once: this is meant to be #included repeatedly, with a different
// FLOW_LOG_CFG_COMPONENT_DEFINE() definition each time.  See xfer/common.hpp and xfer/common.cpp.

// Add new components here, keeping the numbers contiguous and in order.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
FLOW_LOG_CFG_COMPONENT_DEFINE(SESSION, 1)
FLOW_LOG_CFG_COMPONENT_DEFINE(INBOUND, 2)
FLOW_LOG_CFG_COMPONENT_DEFINE(LIFECYCLE, 3)
