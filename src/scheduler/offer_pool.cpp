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

#include "scheduler/offer_pool.hpp"

#include <glog/logging.h>

#include <mesos/type_utils.hpp>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>

#include "scheduler/constants.hpp"
#include "scheduler/resource_utils.hpp"

using mesos::Filters;
using mesos::Offer;
using mesos::OfferID;
using mesos::Resource;
using mesos::Resources;
using mesos::TaskInfo;

using std::string;
using std::vector;

namespace conductor {
namespace internal {
namespace scheduler {

static Offer::Operation LAUNCH(const TaskInfo& task)
{
  Offer::Operation operation;
  operation.set_type(Offer::Operation::LAUNCH);
  operation.mutable_launch()->add_task_infos()->CopyFrom(task);
  return operation;
}


static Offer::Operation DESTROY(const Resource& volume)
{
  Offer::Operation operation;
  operation.set_type(Offer::Operation::DESTROY);
  operation.mutable_destroy()->add_volumes()->CopyFrom(volume);
  return operation;
}


static Offer::Operation UNRESERVE(const Resource& resource)
{
  Offer::Operation operation;
  operation.set_type(Offer::Operation::UNRESERVE);
  operation.mutable_unreserve()->add_resources()->CopyFrom(resource);
  return operation;
}


OfferPool::OfferPool(DriverHandle* _driver)
  : driver(CHECK_NOTNULL(_driver)) {}


void OfferPool::add(const vector<Offer>& offers)
{
  foreach (const Offer& offer, offers) {
    VLOG(1) << "Pooling offer " << offer.id() << " from agent "
            << offer.slave_id() << " with " << offer.resources();

    entries.emplace_back(offer);
  }
}


void OfferPool::rescind(const OfferID& offerId)
{
  for (auto it = entries.begin(); it != entries.end(); ++it) {
    if (it->offer.id() == offerId) {
      entries.erase(it);
      return;
    }
  }
}


Option<TaskInfo> OfferPool::launch(const TaskInfo& task)
{
  foreach (Entry& entry, entries) {
    Resources resources = task.resources();
    if (entry.offer.has_allocation_info()) {
      resources.allocate(entry.offer.allocation_info().role());
    }

    if (!entry.remaining.contains(resources)) {
      continue;
    }

    TaskInfo launched = task;
    launched.mutable_slave_id()->CopyFrom(entry.offer.slave_id());
    launched.mutable_resources()->CopyFrom(resources);

    entry.remaining -= resources;
    entry.operations.push_back(LAUNCH(launched));

    LOG(INFO) << "Launching task '" << launched.task_id() << "' on agent "
              << entry.offer.slave_id() << " using offer "
              << entry.offer.id();

    return launched;
  }

  return None();
}


bool OfferPool::cleanup(const string& resourceId)
{
  foreach (Entry& entry, entries) {
    Option<Resource> resource =
      findResource(entry.remaining, resourceId);

    if (resource.isNone()) {
      continue;
    }

    Resource unreserve = resource.get();

    if (Resources::isPersistentVolume(resource.get())) {
      entry.operations.push_back(DESTROY(resource.get()));

      // The volume no longer exists once destroyed.
      unreserve.mutable_disk()->clear_persistence();
      unreserve.mutable_disk()->clear_volume();
      if (!unreserve.disk().has_source()) {
        unreserve.clear_disk();
      }
    }

    entry.operations.push_back(UNRESERVE(unreserve));
    entry.remaining -= resource.get();

    LOG(INFO) << "Releasing resource '" << resourceId << "' using offer "
              << entry.offer.id();

    return true;
  }

  return false;
}


Try<Nothing> OfferPool::flush()
{
  vector<string> errors;

  foreach (const Entry& entry, entries) {
    Try<Nothing> result = Nothing();

    if (!entry.operations.empty()) {
      result = driver->acceptOffers(
          {entry.offer.id()}, entry.operations, Filters());
    } else {
      Filters filters;
      filters.set_refuse_seconds(DEFAULT_REFUSE_DURATION.secs());

      result = driver->declineOffer(entry.offer.id(), filters);
    }

    if (result.isError()) {
      LOG(WARNING) << "Failed to respond to offer " << entry.offer.id()
                   << ": " << result.error();
      errors.push_back(result.error());
    }
  }

  entries.clear();

  if (!errors.empty()) {
    return Error(stringify(errors));
  }

  return Nothing();
}


size_t OfferPool::size() const
{
  return entries.size();
}

} // namespace scheduler {
} // namespace internal {
} // namespace conductor {
