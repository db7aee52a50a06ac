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
#include "xfer/inbound/synchronizing_message_source.hpp"
#include "xfer/inbound/directory_poller.hpp"
#include "xfer/inbound/remote_synchronizer.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <cassert>

namespace xfer::inbound
{

// Implementations.

Synchronizing_message_source::Synchronizing_message_source(flow::log::Logger* logger_ptr,
                                                           session::Session_pool* pool,
                                                           const Inbound_config& config, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_INBOUND),
  m_config(config),
  m_initialized(false)
{
  using boost::movelib::make_unique;

  // Might throw, or emit error; in the latter case we're unusable (as advertised).
  m_synchronizer = make_unique<Remote_synchronizer>(logger_ptr, pool, m_config, err_code);
  if (err_code && *err_code)
  {
    return;
  }
  // else
  m_file_source = make_unique<Directory_poller>(logger_ptr, m_config.m_local_dir, m_config.m_temporary_file_suffix);

  FLOW_LOG_INFO("Message source [" << S_COMPONENT_TYPE << "]: Created for config [" << m_config << "].");
}

Synchronizing_message_source::Synchronizing_message_source(flow::log::Logger* logger_ptr,
                                                           const Inbound_config& config,
                                                           File_source_ptr&& file_source,
                                                           Synchronizer_ptr&& synchronizer) :
  flow::log::Log_context(logger_ptr, Log_component::S_INBOUND),
  m_config(config),
  m_file_source(std::move(file_source)),
  m_synchronizer(std::move(synchronizer)),
  m_initialized(false)
{
  assert(m_file_source && m_synchronizer);
  FLOW_LOG_INFO("Message source [" << S_COMPONENT_TYPE << "]: Created with user-supplied file source and "
                "synchronizer; local dir [" << m_config.m_local_dir << "].");
}

std::optional<File_message> Synchronizing_message_source::receive(Error_code* err_code)
{
  std::optional<File_message> msg;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> std::optional<File_message> { return receive(actual_err_code); },
         &msg, err_code, "Synchronizing_message_source::receive()"))
  {
    return msg;
  }
  // else

  init(err_code);
  if (*err_code)
  {
    return msg;
  }
  // else

  msg = m_file_source->receive(err_code);
  if (msg || *err_code)
  {
    return msg;
  }
  // else: Nothing local.  Sync up once, which may populate the local directory; then look again.

  const auto n_synced = m_synchronizer->sync_remote_to_local(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Message source [" << S_COMPONENT_TYPE << "]: Synchronization pass failed (files synced "
                     "before failure: [" << n_synced << "]); error [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return msg;
  }
  // else

  FLOW_LOG_TRACE("Message source [" << S_COMPONENT_TYPE << "]: Synchronization pass brought [" << n_synced << "] "
                 "file(s); polling local source again.");
  return m_file_source->receive(err_code);
} // Synchronizing_message_source::receive()

void Synchronizing_message_source::init(Error_code* err_code)
{
  Lock_guard lock(m_mutex);

  if (m_initialized)
  {
    err_code->clear();
    return;
  }
  // else

  ensure_local_directory(get_logger(), m_config.m_local_dir, m_config.m_auto_create_local_dir, err_code);
  m_initialized = !*err_code;
}

} // namespace xfer::inbound
