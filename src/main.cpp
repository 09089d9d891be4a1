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

#include <stdlib.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <mesos/mesos.hpp>
#include <mesos/scheduler.hpp>
#include <mesos/type_utils.hpp>

#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/os.hpp>
#include <stout/result.hpp>
#include <stout/try.hpp>

#include <conductor/plan/plan.hpp>
#include <conductor/plan/plan_coordinator.hpp>
#include <conductor/plan/plan_manager.hpp>

#include "api/process.hpp"

#include "logging/logging.hpp"

#include "scheduler/deploy.hpp"
#include "scheduler/driver.hpp"
#include "scheduler/flags.hpp"
#include "scheduler/offer_pool.hpp"
#include "scheduler/scheduler.hpp"
#include "scheduler/state_store.hpp"

#include "uninstall/plan_builder.hpp"
#include "uninstall/secrets.hpp"

using mesos::FrameworkID;
using mesos::FrameworkInfo;
using mesos::MesosSchedulerDriver;

using process::Owned;

using std::cerr;
using std::cout;
using std::endl;
using std::shared_ptr;
using std::string;
using std::vector;

using conductor::plan::DefaultPlanManager;
using conductor::plan::Plan;
using conductor::plan::PlanCoordinator;
using conductor::plan::PlanManager;

using conductor::internal::api::PlansProcess;

using conductor::internal::scheduler::FileStateStore;
using conductor::internal::scheduler::Flags;
using conductor::internal::scheduler::MesosDriverHandle;
using conductor::internal::scheduler::OfferPool;
using conductor::internal::scheduler::PlanScheduler;

using conductor::internal::uninstall::SecretsClient;

namespace logging = conductor::internal::logging;


int main(int argc, char** argv)
{
  Flags flags;

  Try<flags::Warnings> load = flags.load("CONDUCTOR_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  if (flags.master.isNone()) {
    cerr << flags.usage("Missing required option --master") << endl;
    return EXIT_FAILURE;
  }

  if (flags.work_dir.isNone()) {
    cerr << flags.usage("Missing required option --work_dir") << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], true, flags);

  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  Try<Nothing> mkdir = os::mkdir(flags.work_dir.get());
  if (mkdir.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to create work directory '" << flags.work_dir.get()
      << "': " << mkdir.error();
  }

  FileStateStore stateStore(flags.work_dir.get());
  MesosDriverHandle driverHandle;
  OfferPool offerPool(&driverHandle);

  Try<shared_ptr<Plan>> plan = flags.uninstall
    ? conductor::internal::uninstall::buildUninstallPlan(
          &stateStore,
          &driverHandle,
          &offerPool,
          Option<SecretsClient*>::none(),
          flags.name)
    : conductor::internal::scheduler::buildDeployPlan(
          flags.pods,
          flags.pod_command,
          flags.pod_resources,
          flags.deploy_strategy,
          &stateStore,
          &offerPool);

  if (plan.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to build plan: " << plan.error();
  }

  vector<shared_ptr<PlanManager>> planManagers = {
    std::make_shared<DefaultPlanManager>(plan.get())};

  PlanCoordinator coordinator(planManagers);

  PlansProcess plans(planManagers);
  process::spawn(plans);

  FrameworkInfo framework;
  framework.set_user(flags.user);
  framework.set_name(flags.name);
  framework.set_checkpoint(flags.checkpoint);
  framework.set_failover_timeout(flags.failover_timeout.secs());
  framework.add_roles(flags.role);
  framework.add_capabilities()->set_type(
      FrameworkInfo::Capability::MULTI_ROLE);
  framework.add_capabilities()->set_type(
      FrameworkInfo::Capability::RESERVATION_REFINEMENT);

  if (flags.principal.isSome()) {
    framework.set_principal(flags.principal.get());
  }

  Result<FrameworkID> frameworkId = stateStore.fetchFrameworkId();
  if (frameworkId.isError()) {
    EXIT(EXIT_FAILURE)
      << "Failed to recover framework ID: " << frameworkId.error();
  }

  if (frameworkId.isSome()) {
    LOG(INFO) << "Re-registering with framework ID " << frameworkId.get();
    framework.mutable_id()->CopyFrom(frameworkId.get());
  }

  PlanScheduler scheduler(&stateStore, &driverHandle, &offerPool, &coordinator);

  Owned<MesosSchedulerDriver> driver(new MesosSchedulerDriver(
      &scheduler,
      framework,
      flags.master.get()));

  driverHandle.setDriver(driver.get());

  int status = driver->run() == mesos::DRIVER_STOPPED ? 0 : 1;

  // Ensure that the driver process terminates.
  driver->stop();
  driverHandle.setDriver(nullptr);

  process::terminate(plans);
  process::wait(plans);

  return status;
}
