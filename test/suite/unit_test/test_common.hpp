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

#include "xfer/session/session.hpp"
#include <boost/shared_ptr.hpp>
#include <atomic>
#include <map>
#include <set>
#include <string>
#include <vector>

/// Fakes and other helpers shared among the Flow-Xfer unit tests.
namespace xfer::test
{

// Types.

/**
 * In-memory stand-in for a remote directory tree: a flat map from remote path (e.g., "/in/a.txt") to contents,
 * plus a set of sub-directory paths.  Not thread-safe.
 */
struct Fake_remote_fs
{
  /// Remote path => file contents.
  std::map<std::string, std::string> m_files;
  /// Remote paths of sub-directories.
  std::set<std::string> m_dirs;
  /// Each successful get() appends the remote path here.
  std::vector<std::string> m_downloaded;
};

/// Failure injection for Fake_channel.
struct Fake_channel_faults
{
  /// ls() fails.
  bool m_fail_ls = false;
  /// get() fails for this remote path (empty: never).
  std::string m_fail_get_path;
  /// rm() fails.
  bool m_fail_rm = false;
  /// When a remote op fails, whether the channel thereupon reports itself not connected.
  bool m_disconnect_on_failure = false;
  /// disconnect() emits an error.
  bool m_fail_disconnect = false;
  /// disconnect() throws.
  bool m_throw_on_disconnect = false;
  /// disconnect() throws something that is not a `std::exception`.
  bool m_throw_non_std_on_disconnect = false;
};

/// session::Channel operating on a Fake_remote_fs (if any) and recording what was done to it.
class Fake_channel : public session::Channel
{
public:
  explicit Fake_channel(Fake_remote_fs* remote_fs = nullptr, const Fake_channel_faults& faults = {});

  bool connected() const override;
  void disconnect(Error_code* err_code) override;
  std::vector<session::Remote_file> ls(const std::string& remote_dir, Error_code* err_code) override;
  void get(const std::string& remote_path, const fs::path& local_path, Error_code* err_code) override;
  void rm(const std::string& remote_path, Error_code* err_code) override;

  /// Number of disconnect() calls.
  unsigned int disconnect_count() const;

private:
  void fail(Error_code* err_code);

  Fake_remote_fs* const m_remote_fs;
  const Fake_channel_faults m_faults;
  bool m_connected;
  unsigned int m_disconnect_count;
}; // class Fake_channel

/// session::Connection that just tracks its state.
class Fake_connection : public session::Connection
{
public:
  Fake_connection();

  bool connected() const override;
  void disconnect(Error_code* err_code) override;

  /// Number of disconnect() calls.
  unsigned int disconnect_count() const;

private:
  bool m_connected;
  unsigned int m_disconnect_count;
};

/**
 * session::Session_factory making Session objects out of a Fake_channel and a Fake_connection, keeping a handle to
 * each, so that a test can check what happened to them even after the Session is gone.
 */
class Fake_session_factory : public session::Session_factory
{
public:
  explicit Fake_session_factory(Fake_remote_fs* remote_fs = nullptr, const Fake_channel_faults& faults = {});

  session::Session_ptr create_session(Error_code* err_code) override;

  /// Number of create_session() calls, successful or not.
  unsigned int call_count() const;

  /// The channel of the `idx`-th session created (0-based).
  Fake_channel& channel(size_t idx) const;

  /// The connection of the `idx`-th session created (0-based).
  Fake_connection& connection(size_t idx) const;

  /// Whether both the channel and connection of the `idx`-th session have been disconnected.
  bool closed(size_t idx) const;

  /// Number of sessions created successfully.
  size_t created_count() const;

  /// Makes subsequent create_session() calls fail with #S_CREATE_ERROR (or succeed again).
  void set_fail(bool fail);

  /// What create_session() emits when failing.
  static const Error_code S_CREATE_ERROR;

private:
  Fake_remote_fs* const m_remote_fs;
  const Fake_channel_faults m_faults;
  std::atomic<unsigned int> m_call_count;
  std::atomic<bool> m_fail;
  std::vector<boost::shared_ptr<Fake_channel>> m_channels;
  std::vector<boost::shared_ptr<Fake_connection>> m_connections;
}; // class Fake_session_factory

/// A uniquely-named directory under the system temp directory, removed (recursively) at destruction.
class Temp_dir
{
public:
  Temp_dir();
  ~Temp_dir();
  Temp_dir(const Temp_dir&) = delete;
  Temp_dir& operator=(const Temp_dir&) = delete;

  const fs::path& path() const;

  /// Creates (or overwrites) file `name` in the directory with the given contents.
  void write_file(const std::string& name, const std::string& contents = "x") const;

  /// Contents of file `name` in the directory.
  std::string read_file(const std::string& name) const;

private:
  fs::path m_path;
};

// Free functions.

/**
 * Logger to give to the objects under test: logs to standard output at WARNING verbosity and above, with
 * Flow-Xfer's component names registered.
 *
 * @return See above.
 */
flow::log::Logger* test_logger();

} // namespace xfer::test
