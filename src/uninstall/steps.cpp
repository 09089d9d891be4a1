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

#include "uninstall/steps.hpp"

#include <vector>

#include <glog/logging.h>

#include <mesos/type_utils.hpp>

#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/path.hpp>
#include <stout/result.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include "scheduler/resource_utils.hpp"

using mesos::TaskID;
using mesos::TaskStatus;

using std::string;
using std::vector;

using conductor::plan::Status;

using conductor::internal::scheduler::DriverHandle;
using conductor::internal::scheduler::OfferPool;
using conductor::internal::scheduler::StateStore;

namespace conductor {
namespace internal {
namespace uninstall {

// Suffixes of the TLS artifacts written to the secret store.
static const vector<string> TLS_SUFFIXES = {
  ".crt",
  ".key",
  ".ca",
  ".keystore",
  ".truststore"
};


bool isTLSArtifact(const string& name)
{
  foreach (const string& suffix, TLS_SUFFIXES) {
    if (strings::endsWith(name, suffix)) {
      return true;
    }
  }

  return false;
}


TaskKillStep::TaskKillStep(
    const TaskID& _taskId,
    DriverHandle* _driver,
    const Status& initial)
  : plan::Step("kill-task-" + _taskId.value(), initial),
    taskId(_taskId),
    driver(CHECK_NOTNULL(_driver)) {}


string TaskKillStep::getType() const
{
  return "TaskKillStep";
}


void TaskKillStep::start()
{
  if (isComplete()) {
    return;
  }

  Try<Nothing> kill = driver->killTask(taskId);
  if (kill.isError()) {
    LOG(WARNING) << "Failed to kill task '" << taskId << "': "
                 << kill.error();
    return;
  }

  setStatus(Status::IN_PROGRESS);
}


void TaskKillStep::update(const TaskStatus& status)
{
  if (!(status.task_id() == taskId)) {
    return;
  }

  if (scheduler::isTerminalState(status.state())) {
    setStatus(Status::COMPLETE);
  }
}


ResourceCleanupStep::ResourceCleanupStep(
    const string& _resourceId,
    OfferPool* _offerPool,
    const Status& initial)
  : plan::Step("unreserve-" + _resourceId, initial),
    resourceId(_resourceId),
    offerPool(CHECK_NOTNULL(_offerPool)) {}


string ResourceCleanupStep::getType() const
{
  return "ResourceCleanupStep";
}


Option<string> ResourceCleanupStep::getAsset() const
{
  return resourceId;
}


void ResourceCleanupStep::start()
{
  if (isComplete()) {
    return;
  }

  if (offerPool->cleanup(resourceId)) {
    setStatus(Status::COMPLETE);
  } else {
    setStatus(Status::PREPARED);
  }
}


TLSCleanupStep::TLSCleanupStep(SecretsClient* _secrets, const string& _ns)
  : plan::Step("tls-cleanup"),
    secrets(CHECK_NOTNULL(_secrets)),
    ns(_ns) {}


string TLSCleanupStep::getType() const
{
  return "TLSCleanupStep";
}


void TLSCleanupStep::start()
{
  if (isComplete()) {
    return;
  }

  Try<vector<string>> names = secrets->list(ns);
  if (names.isError()) {
    LOG(ERROR) << "Failed to list secrets in namespace '" << ns << "': "
               << names.error();
    return;
  }

  foreach (const string& name, names.get()) {
    if (!isTLSArtifact(name)) {
      continue;
    }

    const string secret = path::join(ns, name);

    Try<Nothing> remove = secrets->remove(secret);
    if (remove.isError()) {
      LOG(ERROR) << "Failed to remove secret '" << secret << "': "
                 << remove.error();
      return;
    }

    LOG(INFO) << "Removed secret '" << secret << "'";
  }

  setStatus(Status::COMPLETE);
}


DeregisterStep::DeregisterStep(StateStore* _stateStore, DriverHandle* _driver)
  : plan::Step("deregister"),
    stateStore(CHECK_NOTNULL(_stateStore)),
    driver(CHECK_NOTNULL(_driver)) {}


string DeregisterStep::getType() const
{
  return "DeregisterStep";
}


void DeregisterStep::start()
{
  if (isComplete()) {
    return;
  }

  Try<Nothing> clear = stateStore->clearFrameworkId();
  if (clear.isError()) {
    LOG(ERROR) << "Failed to clear framework ID: " << clear.error();
  }

  // Without failover the master tears the framework down.
  LOG(INFO) << "Stopping the scheduler driver";
  Try<Nothing> stop = driver->stop(false);
  if (stop.isError()) {
    LOG(ERROR) << stop.error();
  }

  LOG(INFO) << "Deleting all state of the service";
  Try<Nothing> clearAll = stateStore->clearAllData();
  if (clearAll.isError()) {
    LOG(ERROR) << "Failed to delete state: " << clearAll.error();
  }

  setStatus(Status::COMPLETE);
}

} // namespace uninstall {
} // namespace internal {
} // namespace conductor {
