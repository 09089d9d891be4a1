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

#include "scheduler/driver.hpp"

#include <string>

#include <glog/logging.h>

#include <stout/error.hpp>

using mesos::Filters;
using mesos::Offer;
using mesos::OfferID;
using mesos::SchedulerDriver;
using mesos::TaskID;

using std::string;
using std::vector;

namespace conductor {
namespace internal {
namespace scheduler {

// Maps the status returned by a driver call.
static Try<Nothing> result(const string& call, mesos::Status status)
{
  if (status != mesos::DRIVER_RUNNING) {
    return Error(
        "Failed to " + call + ": driver is in state " +
        mesos::Status_Name(status));
  }

  return Nothing();
}


void MesosDriverHandle::setDriver(SchedulerDriver* _driver)
{
  driver.store(_driver);
}


Try<Nothing> MesosDriverHandle::acceptOffers(
    const vector<OfferID>& offerIds,
    const vector<Offer::Operation>& operations,
    const Filters& filters)
{
  SchedulerDriver* _driver = driver.load();
  if (_driver == nullptr) {
    return Error("Failed to accept offers: no driver");
  }

  return result("accept offers", _driver->acceptOffers(
      offerIds, operations, filters));
}


Try<Nothing> MesosDriverHandle::declineOffer(
    const OfferID& offerId,
    const Filters& filters)
{
  SchedulerDriver* _driver = driver.load();
  if (_driver == nullptr) {
    return Error("Failed to decline offer: no driver");
  }

  return result("decline offer", _driver->declineOffer(offerId, filters));
}


Try<Nothing> MesosDriverHandle::killTask(const TaskID& taskId)
{
  SchedulerDriver* _driver = driver.load();
  if (_driver == nullptr) {
    return Error("Failed to kill task: no driver");
  }

  return result("kill task", _driver->killTask(taskId));
}


Try<Nothing> MesosDriverHandle::stop(bool failover)
{
  SchedulerDriver* _driver = driver.load();
  if (_driver == nullptr) {
    return Error("Failed to stop driver: no driver");
  }

  // NOTE: A successful stop leaves the driver in DRIVER_STOPPED.
  mesos::Status status = _driver->stop(failover);
  if (status != mesos::DRIVER_STOPPED) {
    return Error(
        "Failed to stop driver: driver is in state " +
        mesos::Status_Name(status));
  }

  return Nothing();
}

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {
