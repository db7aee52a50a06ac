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
#include "xfer/inbound/remote_synchronizer.hpp"
#include "xfer/inbound/error.hpp"
#include "xfer/session/session_lease.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <algorithm>

namespace xfer::inbound
{

// Implementations.

Remote_synchronizer::Remote_synchronizer(flow::log::Logger* logger_ptr, session::Session_pool* pool,
                                         const Inbound_config& config, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_INBOUND),
  m_pool(pool),
  m_config(config)
{
  using flow::error::Runtime_error;

  Error_code our_err_code;
  if (m_config.m_local_dir.empty() || m_config.m_temporary_file_suffix.empty())
  {
    our_err_code = error::Code::S_INVALID_ARGUMENT;
  }
  else if (m_config.m_filename_pattern)
  {
    m_filter_or_none.emplace(*m_config.m_filename_pattern, &our_err_code);
  }

  if (our_err_code)
  {
    FLOW_LOG_WARNING("Remote synchronizer: Bad config [" << m_config << "]; error "
                     "[" << our_err_code << "] [" << our_err_code.message() << "].");
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  FLOW_LOG_INFO("Remote synchronizer: Created with config [" << m_config << "].");
  if (err_code)
  {
    err_code->clear();
  }
} // Remote_synchronizer::Remote_synchronizer()

size_t Remote_synchronizer::sync_remote_to_local(Error_code* err_code)
{
  using session::Session_lease;
  using session::Remote_file;

  size_t n_synced = 0;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> size_t { return sync_remote_to_local(actual_err_code); },
         &n_synced, err_code, "Remote_synchronizer::sync_remote_to_local()"))
  {
    return n_synced;
  }
  // else

  Lock_guard lock(m_mutex);

  ensure_local_directory(get_logger(), m_config.m_local_dir, m_config.m_auto_create_local_dir, err_code);
  if (*err_code)
  {
    return 0; // It logged.
  }
  // else

  Session_lease lease(m_pool, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Remote synchronizer: Could not obtain session; error [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return 0;
  }
  // else
  auto& channel = lease->channel();

  // A remote failure may or may not have hosed the session.  Only throw it away if it says it's hosed.
  const auto on_remote_error = [&](String_view what)
  {
    FLOW_LOG_WARNING("Remote synchronizer: Remote op [" << what << "] failed via session [" << *lease << "]; "
                     "error [" << *err_code << "] [" << err_code->message() << "].  Files synced before this: "
                     "[" << n_synced << "].");
    if (!lease->connected())
    {
      lease.discard();
    }
  };

  auto files = channel.ls(m_config.m_remote_dir, err_code);
  if (*err_code)
  {
    on_remote_error("ls");
    return 0;
  }
  // else

  const auto n_listed = files.size();
  if (m_filter_or_none)
  {
    files = m_filter_or_none->filter(files);
  }
  else
  {
    files.erase(std::remove_if(files.begin(), files.end(), [](const Remote_file& file) { return file.m_is_dir; }),
                files.end());
  }

  FLOW_LOG_TRACE("Remote synchronizer: Remote dir [" << m_config.m_remote_dir << "] listed "
                 "[" << n_listed << "] entries; of these [" << files.size() << "] are candidates.");

  for (const auto& file : files)
  {
    const auto local_path = m_config.m_local_dir / file.m_name;
    const auto tmp_path = m_config.m_local_dir / (file.m_name + m_config.m_temporary_file_suffix);
    const auto remote = remote_path(file.m_name);

    Error_code exists_err_code; // Treat an existence-check failure as nonexistence; the download will tell.
    if (fs::exists(local_path, exists_err_code))
    {
      FLOW_LOG_TRACE("Remote synchronizer: Skipping remote file [" << file << "]: exists locally already.");
      continue;
    }
    // else

    channel.get(remote, tmp_path, err_code);
    if (*err_code)
    {
      Error_code rm_err_code;
      fs::remove(tmp_path, rm_err_code); // Partial download; don't care if it's not there.
      on_remote_error("get");
      return n_synced;
    }
    // else

    fs::rename(tmp_path, local_path, *err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Remote synchronizer: Downloaded [" << remote << "] to [" << tmp_path << "] but could not "
                       "rename to [" << local_path << "]; error [" << *err_code << "] "
                       "[" << err_code->message() << "].");
      return n_synced;
    }
    // else
    ++n_synced;

    if (m_config.m_delete_remote_files)
    {
      channel.rm(remote, err_code);
      if (*err_code)
      {
        on_remote_error("rm");
        return n_synced;
      }
    }

    FLOW_LOG_INFO("Remote synchronizer: Synced remote file [" << file << "] to [" << local_path << "] "
                  "(remote deleted? = [" << m_config.m_delete_remote_files << "]).");
  } // for (file : files)

  err_code->clear();
  return n_synced;
} // Remote_synchronizer::sync_remote_to_local()

const Inbound_config& Remote_synchronizer::config() const
{
  return m_config;
}

std::string Remote_synchronizer::remote_path(const std::string& name) const
{
  const auto& dir = m_config.m_remote_dir;
  if (dir.empty())
  {
    return name;
  }
  // else
  return (dir.back() == '/') ? (dir + name) : (dir + '/' + name);
}

} // namespace xfer::inbound
