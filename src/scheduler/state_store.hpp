// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __SCHEDULER_STATE_STORE_HPP__
#define __SCHEDULER_STATE_STORE_HPP__

#include <mutex>
#include <string>
#include <vector>

#include <mesos/mesos.hpp>

#include <stout/nothing.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

namespace conductor {
namespace internal {
namespace scheduler {

/**
 * Persistent state of the service: the framework id, and for every
 * task (keyed by task name) its latest `TaskInfo` and `TaskStatus`.
 * Plans are rebuilt from this state whenever the scheduler restarts.
 */
class StateStore
{
public:
  virtual ~StateStore() {}

  virtual Try<Nothing> storeFrameworkId(
      const mesos::FrameworkID& frameworkId) = 0;

  // None if no framework id has been stored.
  virtual Result<mesos::FrameworkID> fetchFrameworkId() = 0;

  virtual Try<Nothing> clearFrameworkId() = 0;

  virtual Try<Nothing> storeTasks(
      const std::vector<mesos::TaskInfo>& tasks) = 0;

  virtual Try<std::vector<mesos::TaskInfo>> fetchTasks() = 0;

  // None if no task with this name has been stored.
  virtual Result<mesos::TaskInfo> fetchTask(const std::string& taskName) = 0;

  // Fails if the status does not belong to the latest stored task of
  // the same name.
  virtual Try<Nothing> storeStatus(const mesos::TaskStatus& status) = 0;

  virtual Try<std::vector<mesos::TaskStatus>> fetchStatuses() = 0;

  virtual Result<mesos::TaskStatus> fetchStatus(
      const std::string& taskName) = 0;

  // Removes everything, including the framework id.
  virtual Try<Nothing> clearAllData() = 0;
};


// Checkpoints the state as protobuf files below a root directory:
//
//   <root>/framework_id
//   <root>/tasks/<name>/info
//   <root>/tasks/<name>/status
class FileStateStore : public StateStore
{
public:
  explicit FileStateStore(const std::string& rootDir);

  ~FileStateStore() override {}

  Try<Nothing> storeFrameworkId(
      const mesos::FrameworkID& frameworkId) override;

  Result<mesos::FrameworkID> fetchFrameworkId() override;

  Try<Nothing> clearFrameworkId() override;

  Try<Nothing> storeTasks(const std::vector<mesos::TaskInfo>& tasks) override;

  Try<std::vector<mesos::TaskInfo>> fetchTasks() override;

  Result<mesos::TaskInfo> fetchTask(const std::string& taskName) override;

  Try<Nothing> storeStatus(const mesos::TaskStatus& status) override;

  Try<std::vector<mesos::TaskStatus>> fetchStatuses() override;

  Result<mesos::TaskStatus> fetchStatus(const std::string& taskName) override;

  Try<Nothing> clearAllData() override;

private:
  const std::string rootDir;

  std::mutex mutex;
};


namespace paths {

std::string getFrameworkIdPath(const std::string& rootDir);

std::string getTasksDir(const std::string& rootDir);

std::string getTaskInfoPath(
    const std::string& rootDir,
    const std::string& taskName);

std::string getTaskStatusPath(
    const std::string& rootDir,
    const std::string& taskName);

} // namespace paths {

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_STATE_STORE_HPP__
