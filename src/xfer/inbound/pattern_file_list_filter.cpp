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
#include "xfer/inbound/pattern_file_list_filter.hpp"
#include "xfer/inbound/error.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <iterator>

namespace xfer::inbound
{

// Implementations.

Pattern_file_list_filter::Pattern_file_list_filter(const std::string& pattern, Error_code* err_code) :
  m_pattern(pattern)
{
  using flow::error::Runtime_error;
  using std::regex;
  using std::regex_error;

  Error_code our_err_code;
  try
  {
    m_regex = regex(m_pattern, regex::ECMAScript);
  }
  catch (const regex_error&)
  {
    // Carries nothing we'd want beyond "it did not compile"; the pattern itself is the interesting part.
    our_err_code = error::Code::S_INVALID_ARGUMENT;
  }

  if (our_err_code)
  {
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, "Pattern_file_list_filter::Pattern_file_list_filter(): [" + m_pattern + ']');
  }
  // else
  if (err_code)
  {
    err_code->clear();
  }
} // Pattern_file_list_filter::Pattern_file_list_filter()

bool Pattern_file_list_filter::accept(const session::Remote_file& file) const
{
  return (!file.m_is_dir) && std::regex_match(file.m_name, m_regex);
}

std::vector<session::Remote_file>
  Pattern_file_list_filter::filter(const std::vector<session::Remote_file>& files) const
{
  std::vector<session::Remote_file> accepted;
  std::copy_if(files.begin(), files.end(), std::back_inserter(accepted),
               [this](const session::Remote_file& file) { return accept(file); });
  return accepted;
}

const std::string& Pattern_file_list_filter::pattern() const
{
  return m_pattern;
}

} // namespace xfer::inbound
