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

#ifndef __SCHEDULER_FLAGS_HPP__
#define __SCHEDULER_FLAGS_HPP__

#include <string>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

#include "scheduler/constants.hpp"

namespace conductor {
namespace internal {
namespace scheduler {

class Flags : public virtual logging::Flags
{
public:
  Flags()
  {
    add(&Flags::master,
        "master",
        "The master to connect to. May be one of:\n"
        "  `host:port`\n"
        "  `master@host:port` (PID of the master)\n"
        "  `zk://host1:port1,host2:port2,.../path`\n"
        "  `file://path/to/file` (where file contains one of the above)");

    add(&Flags::name,
        "name",
        "Name of the service, registered as the framework name.",
        "hello-world");

    add(&Flags::role,
        "role",
        "Role to use when registering.",
        "*");

    add(&Flags::principal,
        "principal",
        "The principal used to identify this framework.");

    add(&Flags::user,
        "user",
        "The user to run the tasks as. If empty, Mesos fills in the\n"
        "user the scheduler runs as.",
        "");

    add(&Flags::checkpoint,
        "checkpoint",
        "Whether this framework should be checkpointed.",
        true);

    add(&Flags::failover_timeout,
        "failover_timeout",
        "How long the master waits for the scheduler to fail over\n"
        "before it tears the framework down.",
        DEFAULT_FAILOVER_TIMEOUT);

    add(&Flags::work_dir,
        "work_dir",
        "Directory under which the state of the service (framework id,\n"
        "tasks and their latest statuses) is checkpointed.");

    add(&Flags::pods,
        "pods",
        "Number of pod instances to deploy.",
        1);

    add(&Flags::pod_command,
        "pod_command",
        "The shell command run by each pod.",
        "echo hello && sleep 1000");

    add(&Flags::pod_resources,
        "pod_resources",
        "The resources used by each pod.",
        "cpus:0.1;mem:32");

    add(&Flags::deploy_strategy,
        "deploy_strategy",
        "Order in which pods are deployed: `serial` or `parallel`.",
        "serial");

    add(&Flags::uninstall,
        "uninstall",
        "Whether to uninstall the service: kill all of its tasks,\n"
        "release its reserved resources and deregister the framework.",
        false);
  }

  Option<std::string> master;
  std::string name;
  std::string role;
  Option<std::string> principal;
  std::string user;
  bool checkpoint;
  Duration failover_timeout;
  Option<std::string> work_dir;
  int pods;
  std::string pod_command;
  std::string pod_resources;
  std::string deploy_strategy;
  bool uninstall;
};

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {

#endif // __SCHEDULER_FLAGS_HPP__
