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
#include "xfer/inbound/file_source.hpp"
#include "xfer/inbound/error.hpp"
#include <flow/error/error.hpp>

namespace xfer::inbound
{

// Implementations.

File_source::~File_source() = default;

Synchronizer::~Synchronizer() = default;

void ensure_local_directory(flow::log::Logger* logger_ptr, const fs::path& local_dir, bool auto_create,
                            Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { ensure_local_directory(logger_ptr, local_dir, auto_create, actual_err_code); },
         err_code, "inbound::ensure_local_directory()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_INBOUND);

  if (local_dir.empty())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    FLOW_LOG_WARNING("Local directory: Path is empty; error [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  const auto status = fs::status(local_dir, *err_code);
  if (*err_code && (status.type() != fs::file_not_found))
  {
    FLOW_LOG_WARNING("Local directory [" << local_dir << "]: Could not check existence; error "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else
  err_code->clear(); // Not-found is not an error for us (yet).

  if (fs::is_directory(status))
  {
    return;
  }
  // else
  if (fs::exists(status))
  {
    *err_code = error::Code::S_LOCAL_PATH_NOT_A_DIRECTORY;
    FLOW_LOG_WARNING("Local directory [" << local_dir << "]: Exists but is not a directory; error "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  if (!auto_create)
  {
    *err_code = error::Code::S_LOCAL_DIRECTORY_NOT_FOUND;
    FLOW_LOG_WARNING("Local directory [" << local_dir << "]: Does not exist, and auto-create is disabled; error "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_INFO("Local directory [" << local_dir << "]: Does not exist; will create.");
  fs::create_directories(local_dir, *err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Local directory [" << local_dir << "]: Could not create; error "
                     "[" << *err_code << "] [" << err_code->message() << "].");
  }
} // ensure_local_directory()

std::ostream& operator<<(std::ostream& os, const File_message& val)
{
  return os << "file[" << val.m_file << ']';
}

std::ostream& operator<<(std::ostream& os, const Inbound_config& val)
{
  os << "remote_dir[" << val.m_remote_dir << "] local_dir[" << val.m_local_dir << "] pattern[";
  if (val.m_filename_pattern)
  {
    os << *val.m_filename_pattern;
  }
  return os << "] auto_create[" << val.m_auto_create_local_dir << "] "
               "delete_remote[" << val.m_delete_remote_files << "] tmp_suffix[" << val.m_temporary_file_suffix << ']';
}

} // namespace xfer::inbound
