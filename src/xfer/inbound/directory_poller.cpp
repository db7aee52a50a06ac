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
#include "xfer/inbound/directory_poller.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <vector>

namespace xfer::inbound
{

// Implementations.

Directory_poller::Directory_poller(flow::log::Logger* logger_ptr, const fs::path& directory,
                                   const std::string& temporary_file_suffix) :
  flow::log::Log_context(logger_ptr, Log_component::S_INBOUND),
  m_directory(directory),
  m_temporary_file_suffix(temporary_file_suffix)
{
  FLOW_LOG_TRACE("Directory poller [" << m_directory << "]: Created.");
}

std::optional<File_message> Directory_poller::receive(Error_code* err_code)
{
  std::optional<File_message> msg;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> std::optional<File_message> { return receive(actual_err_code); },
         &msg, err_code, "Directory_poller::receive()"))
  {
    return msg;
  }
  // else

  Lock_guard lock(m_mutex);

  if (m_queue.empty())
  {
    scan(err_code);
    if (*err_code)
    {
      return msg;
    }
  }
  // else if (!m_queue.empty()) { Do not even look at the directory.  Whatever's new will be picked up later. }

  if (!m_queue.empty())
  {
    msg.emplace(File_message{ std::move(m_queue.front()) });
    m_queue.pop_front();
    FLOW_LOG_TRACE("Directory poller [" << m_directory << "]: Emitting [" << *msg << "]; "
                   "still queued: [" << m_queue.size() << "].");
  }

  err_code->clear();
  return msg;
} // Directory_poller::receive()

void Directory_poller::scan(Error_code* err_code)
{
  using std::string;
  using std::vector;

  vector<string> found;

  fs::directory_iterator dir_it(m_directory, *err_code);
  const fs::directory_iterator end_it;
  while ((!*err_code) && (dir_it != end_it))
  {
    Error_code status_err_code; // A file vanishing mid-scan is not our problem; just skip it.
    const auto status = dir_it->status(status_err_code);
    if ((!status_err_code) && fs::is_regular_file(status))
    {
      auto name = dir_it->path().filename().string();
      if ((!is_temporary(name)) && (m_seen.count(name) == 0))
      {
        found.emplace_back(std::move(name));
      }
    }
    dir_it.increment(*err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Directory poller [" << m_directory << "]: Could not list directory; error "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  std::sort(found.begin(), found.end());
  for (auto& name : found)
  {
    m_queue.emplace_back(m_directory / name);
    m_seen.emplace(std::move(name));
  }

  FLOW_LOG_TRACE("Directory poller [" << m_directory << "]: Scan found [" << found.size() << "] new file(s).");
} // Directory_poller::scan()

bool Directory_poller::is_temporary(const std::string& name) const
{
  const auto& suffix = m_temporary_file_suffix;
  return (!suffix.empty()) && (name.size() > suffix.size())
         && (name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0);
}

const fs::path& Directory_poller::directory() const
{
  return m_directory;
}

} // namespace xfer::inbound
