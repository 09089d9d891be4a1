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

#include "scheduler/state_store.hpp"

#include <list>

#include <glog/logging.h>

#include <mesos/type_utils.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/protobuf.hpp>
#include <stout/synchronized.hpp>

#include "scheduler/resource_utils.hpp"

using mesos::FrameworkID;
using mesos::TaskInfo;
using mesos::TaskStatus;

using std::list;
using std::string;
using std::vector;

namespace conductor {
namespace internal {
namespace scheduler {

namespace paths {

string getFrameworkIdPath(const string& rootDir)
{
  return path::join(rootDir, "framework_id");
}


string getTasksDir(const string& rootDir)
{
  return path::join(rootDir, "tasks");
}


string getTaskInfoPath(const string& rootDir, const string& taskName)
{
  return path::join(getTasksDir(rootDir), taskName, "info");
}


string getTaskStatusPath(const string& rootDir, const string& taskName)
{
  return path::join(getTasksDir(rootDir), taskName, "status");
}

} // namespace paths {


// A missing file is `None`, not an error.
template <typename T>
static Result<T> read(const string& path)
{
  if (!os::exists(path)) {
    return None();
  }

  return ::protobuf::read<T>(path);
}


// Writes the message to a temporary file first and renames it to
// `path`, so that a crash never leaves a partially written file.
static Try<Nothing> checkpoint(
    const string& path,
    const google::protobuf::Message& message)
{
  const string base = Path(path).dirname();

  Try<Nothing> mkdir = os::mkdir(base);
  if (mkdir.isError()) {
    return Error("Failed to create directory '" + base + "': " + mkdir.error());
  }

  Try<string> temp = os::mktemp(path::join(base, "XXXXXX"));
  if (temp.isError()) {
    return Error("Failed to create temporary file: " + temp.error());
  }

  Try<Nothing> write = ::protobuf::write(temp.get(), message);
  if (write.isError()) {
    Try<Nothing> rm = os::rm(temp.get());
    if (rm.isError()) {
      LOG(WARNING) << "Failed to remove '" << temp.get() << "': "
                   << rm.error();
    }

    return Error("Failed to write temporary file '" + temp.get() +
                 "': " + write.error());
  }

  Try<Nothing> rename = os::rename(temp.get(), path);
  if (rename.isError()) {
    Try<Nothing> rm = os::rm(temp.get());
    if (rm.isError()) {
      LOG(WARNING) << "Failed to remove '" << temp.get() << "': "
                   << rm.error();
    }

    return Error("Failed to rename '" + temp.get() + "' to '" +
                 path + "': " + rename.error());
  }

  return Nothing();
}


FileStateStore::FileStateStore(const string& _rootDir)
  : rootDir(_rootDir) {}


Try<Nothing> FileStateStore::storeFrameworkId(const FrameworkID& frameworkId)
{
  synchronized (mutex) {
    return checkpoint(paths::getFrameworkIdPath(rootDir), frameworkId);
  }
}


Result<FrameworkID> FileStateStore::fetchFrameworkId()
{
  synchronized (mutex) {
    return read<FrameworkID>(paths::getFrameworkIdPath(rootDir));
  }
}


Try<Nothing> FileStateStore::clearFrameworkId()
{
  synchronized (mutex) {
    const string path = paths::getFrameworkIdPath(rootDir);
    if (!os::exists(path)) {
      return Nothing();
    }

    return os::rm(path);
  }
}


Try<Nothing> FileStateStore::storeTasks(const vector<TaskInfo>& tasks)
{
  synchronized (mutex) {
    foreach (const TaskInfo& task, tasks) {
      Try<Nothing> checkpointed =
        checkpoint(paths::getTaskInfoPath(rootDir, task.name()), task);

      if (checkpointed.isError()) {
        return Error(
            "Failed to store task '" + task.name() + "': " +
            checkpointed.error());
      }
    }

    return Nothing();
  }
}


Try<vector<TaskInfo>> FileStateStore::fetchTasks()
{
  synchronized (mutex) {
    vector<TaskInfo> tasks;

    const string tasksDir = paths::getTasksDir(rootDir);
    if (!os::exists(tasksDir)) {
      return tasks;
    }

    Try<list<string>> names = os::ls(tasksDir);
    if (names.isError()) {
      return Error("Failed to list '" + tasksDir + "': " + names.error());
    }

    foreach (const string& name, names.get()) {
      Result<TaskInfo> task =
        read<TaskInfo>(paths::getTaskInfoPath(rootDir, name));

      if (task.isError()) {
        return Error("Failed to read task '" + name + "': " + task.error());
      }

      if (task.isNone()) {
        LOG(WARNING) << "Ignoring task '" << name << "' without TaskInfo";
        continue;
      }

      tasks.push_back(task.get());
    }

    return tasks;
  }
}


Result<TaskInfo> FileStateStore::fetchTask(const string& taskName)
{
  synchronized (mutex) {
    return read<TaskInfo>(paths::getTaskInfoPath(rootDir, taskName));
  }
}


Try<Nothing> FileStateStore::storeStatus(const TaskStatus& status)
{
  Try<string> taskName = getTaskName(status.task_id());
  if (taskName.isError()) {
    return Error(taskName.error());
  }

  synchronized (mutex) {
    Result<TaskInfo> task =
      read<TaskInfo>(paths::getTaskInfoPath(rootDir, taskName.get()));

    if (task.isError()) {
      return Error(
          "Failed to read task '" + taskName.get() + "': " + task.error());
    }

    if (task.isNone() || !(task->task_id() == status.task_id())) {
      return Error(
          "Status for unknown task '" + status.task_id().value() + "'");
    }

    return checkpoint(
        paths::getTaskStatusPath(rootDir, taskName.get()), status);
  }
}


Try<vector<TaskStatus>> FileStateStore::fetchStatuses()
{
  synchronized (mutex) {
    vector<TaskStatus> statuses;

    const string tasksDir = paths::getTasksDir(rootDir);
    if (!os::exists(tasksDir)) {
      return statuses;
    }

    Try<list<string>> names = os::ls(tasksDir);
    if (names.isError()) {
      return Error("Failed to list '" + tasksDir + "': " + names.error());
    }

    foreach (const string& name, names.get()) {
      Result<TaskStatus> status =
        read<TaskStatus>(paths::getTaskStatusPath(rootDir, name));

      if (status.isError()) {
        return Error(
            "Failed to read status of task '" + name + "': " +
            status.error());
      }

      if (status.isSome()) {
        statuses.push_back(status.get());
      }
    }

    return statuses;
  }
}


Result<TaskStatus> FileStateStore::fetchStatus(const string& taskName)
{
  synchronized (mutex) {
    return read<TaskStatus>(paths::getTaskStatusPath(rootDir, taskName));
  }
}


Try<Nothing> FileStateStore::clearAllData()
{
  synchronized (mutex) {
    if (!os::exists(rootDir)) {
      return Nothing();
    }

    Try<Nothing> rmdir = os::rmdir(rootDir);
    if (rmdir.isError()) {
      return Error("Failed to remove '" + rootDir + "': " + rmdir.error());
    }

    return Nothing();
  }
}

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {
