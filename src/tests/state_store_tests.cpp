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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <mesos/mesos.hpp>
#include <mesos/type_utils.hpp>

#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include <stout/tests/utils.hpp>

#include "scheduler/resource_utils.hpp"
#include "scheduler/state_store.hpp"

#include "tests/utils.hpp"

using mesos::FrameworkID;
using mesos::TaskInfo;
using mesos::TaskStatus;

using std::string;
using std::vector;

using conductor::internal::scheduler::FileStateStore;

namespace paths = conductor::internal::scheduler::paths;

namespace conductor {
namespace internal {
namespace tests {

class FileStateStoreTest : public TemporaryDirectoryTest
{
protected:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    rootDir = path::join(os::getcwd(), "state");
  }

  string rootDir;
};


TEST_F(FileStateStoreTest, FrameworkId)
{
  FileStateStore store(rootDir);

  EXPECT_NONE(store.fetchFrameworkId());

  FrameworkID frameworkId;
  frameworkId.set_value("framework-1");

  ASSERT_SOME(store.storeFrameworkId(frameworkId));
  EXPECT_TRUE(os::exists(paths::getFrameworkIdPath(rootDir)));

  // A second store sees the checkpointed id.
  FileStateStore recovered(rootDir);
  EXPECT_SOME_EQ(frameworkId, recovered.fetchFrameworkId());

  ASSERT_SOME(store.clearFrameworkId());
  EXPECT_NONE(store.fetchFrameworkId());

  // Clearing twice is fine.
  EXPECT_SOME(store.clearFrameworkId());
}


TEST_F(FileStateStoreTest, Tasks)
{
  FileStateStore store(rootDir);

  Try<vector<TaskInfo>> tasks = store.fetchTasks();
  ASSERT_SOME(tasks);
  EXPECT_TRUE(tasks->empty());

  const TaskInfo task0 = createTask("pod-0-task");
  const TaskInfo task1 = createTask("pod-1-task");

  ASSERT_SOME(store.storeTasks({task0, task1}));

  tasks = store.fetchTasks();
  ASSERT_SOME(tasks);
  EXPECT_EQ(2u, tasks->size());

  Result<TaskInfo> fetched = store.fetchTask("pod-0-task");
  ASSERT_SOME(fetched);
  EXPECT_EQ(task0.task_id(), fetched->task_id());

  EXPECT_NONE(store.fetchTask("pod-2-task"));

  // Tasks are keyed by name: a relaunch replaces the stored task.
  TaskInfo relaunched = task0;
  relaunched.mutable_task_id()->set_value("pod-0-task__1");

  ASSERT_SOME(store.storeTasks({relaunched}));

  fetched = store.fetchTask("pod-0-task");
  ASSERT_SOME(fetched);
  EXPECT_EQ(relaunched.task_id(), fetched->task_id());
}


TEST_F(FileStateStoreTest, Statuses)
{
  FileStateStore store(rootDir);

  const TaskInfo task = createTask("pod-0-task");

  // Statuses of unknown tasks are refused.
  const TaskStatus status =
    createTaskStatus(task.task_id(), mesos::TASK_RUNNING);

  EXPECT_ERROR(store.storeStatus(status));

  ASSERT_SOME(store.storeTasks({task}));
  ASSERT_SOME(store.storeStatus(status));

  Result<TaskStatus> fetched = store.fetchStatus("pod-0-task");
  ASSERT_SOME(fetched);
  EXPECT_EQ(status.task_id(), fetched->task_id());
  EXPECT_EQ(mesos::TASK_RUNNING, fetched->state());

  Try<vector<TaskStatus>> statuses = store.fetchStatuses();
  ASSERT_SOME(statuses);
  ASSERT_EQ(1u, statuses->size());
  EXPECT_EQ(status.task_id(), statuses->front().task_id());

  // A status for a previous launch of the task is refused too.
  TaskStatus stale = status;
  stale.mutable_task_id()->set_value("pod-0-task__stale");

  EXPECT_ERROR(store.storeStatus(stale));

  // Task ids without a task name are refused.
  TaskStatus malformed = status;
  malformed.mutable_task_id()->set_value("pod-0-task");

  EXPECT_ERROR(store.storeStatus(malformed));
}


TEST_F(FileStateStoreTest, ClearAllData)
{
  FileStateStore store(rootDir);

  FrameworkID frameworkId;
  frameworkId.set_value("framework-1");

  const TaskInfo task = createTask("pod-0-task");

  ASSERT_SOME(store.storeFrameworkId(frameworkId));
  ASSERT_SOME(store.storeTasks({task}));

  ASSERT_SOME(store.clearAllData());

  EXPECT_FALSE(os::exists(rootDir));
  EXPECT_NONE(store.fetchFrameworkId());

  Try<vector<TaskInfo>> tasks = store.fetchTasks();
  ASSERT_SOME(tasks);
  EXPECT_TRUE(tasks->empty());

  // Nothing left to clear.
  EXPECT_SOME(store.clearAllData());
}


TEST(ResourceUtilsTest, TaskName)
{
  mesos::TaskID taskId = scheduler::newTaskId("pod-0-task");

  EXPECT_SOME_EQ("pod-0-task", scheduler::getTaskName(taskId));

  // The name may contain the delimiter itself.
  taskId.set_value("pod__0__uuid");
  EXPECT_SOME_EQ("pod__0", scheduler::getTaskName(taskId));

  taskId.set_value("pod-0-task");
  EXPECT_ERROR(scheduler::getTaskName(taskId));

  taskId.set_value("__uuid");
  EXPECT_ERROR(scheduler::getTaskName(taskId));
}


TEST(ResourceUtilsTest, ResourceIds)
{
  TaskInfo task0 = createTask("pod-0-task");
  task0.add_resources()->CopyFrom(
      createReservedResource("cpus", 1, "role", "resource-0"));
  task0.add_resources()->CopyFrom(
      createReservedResource("mem", 32, "role", "resource-1"));

  mesos::ExecutorInfo* executor = task0.mutable_executor();
  executor->mutable_executor_id()->set_value("executor");
  executor->add_resources()->CopyFrom(
      createReservedResource("cpus", 0.1, "role", "resource-2"));

  // Tasks sharing an executor report the same executor resource.
  TaskInfo task1 = createTask("pod-1-task");
  task1.mutable_executor()->CopyFrom(*executor);

  EXPECT_EQ(
      vector<string>({"resource-0", "resource-1", "resource-2"}),
      scheduler::getResourceIds({task0, task1}));
}


TEST(ResourceUtilsTest, TerminalStates)
{
  EXPECT_TRUE(scheduler::isTerminalState(mesos::TASK_FINISHED));
  EXPECT_TRUE(scheduler::isTerminalState(mesos::TASK_FAILED));
  EXPECT_TRUE(scheduler::isTerminalState(mesos::TASK_KILLED));
  EXPECT_TRUE(scheduler::isTerminalState(mesos::TASK_ERROR));
  EXPECT_TRUE(scheduler::isTerminalState(mesos::TASK_GONE));

  EXPECT_FALSE(scheduler::isTerminalState(mesos::TASK_STAGING));
  EXPECT_FALSE(scheduler::isTerminalState(mesos::TASK_RUNNING));
  EXPECT_FALSE(scheduler::isTerminalState(mesos::TASK_UNREACHABLE));
}

} // namespace tests {
} // namespace internal {
} // namespace conductor {
