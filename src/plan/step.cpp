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

#include <map>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/synchronized.hpp>

#include <conductor/plan/step.hpp>

using std::map;
using std::string;
using std::vector;

namespace conductor {
namespace plan {

Step::Step(const string& _name, const Status& initial)
  : id(id::UUID::random()),
    name(_name),
    status(initial),
    interrupted(false) {}


const id::UUID& Step::getId() const
{
  return id;
}


const string& Step::getName() const
{
  return name;
}


string Step::getType() const
{
  return "Step";
}


Status Step::getStatus() const
{
  synchronized (mutex) {
    if (interrupted &&
        (status == Status::PENDING || status == Status::PREPARED)) {
      return Status::WAITING;
    }

    return status;
  }
}


vector<string> Step::getErrors() const
{
  synchronized (mutex) {
    return errors;
  }
}


bool Step::interrupt()
{
  synchronized (mutex) {
    if (interrupted) {
      return false;
    }

    interrupted = true;
    return true;
  }
}


bool Step::proceed()
{
  synchronized (mutex) {
    if (!interrupted) {
      return false;
    }

    interrupted = false;
    return true;
  }
}


bool Step::isInterrupted() const
{
  synchronized (mutex) {
    return interrupted;
  }
}


void Step::update(const mesos::TaskStatus& status) {}


void Step::updateParameters(const map<string, string>& parameters) {}


vector<Element*> Step::restart()
{
  LOG(WARNING) << "Restarting step: '" << name << " [" << id << "]'";

  vector<Element*> modified;
  if (reset(Status::PENDING)) {
    modified.push_back(this);
  }

  return modified;
}


vector<Element*> Step::forceComplete()
{
  LOG(WARNING) << "Forcing completion of step: '" << name
               << " [" << id << "]'";

  vector<Element*> modified;
  if (reset(Status::COMPLETE)) {
    modified.push_back(this);
  }

  return modified;
}


bool Step::hasConflicts(const hashset<string>& dirtyAssets) const
{
  const Option<string> asset = getAsset();

  return asset.isSome() && dirtyAssets.contains(asset.get());
}


Option<string> Step::getAsset() const
{
  return None();
}


Status Step::setStatus(const Status& _status)
{
  Status previous;

  synchronized (mutex) {
    previous = status;
    status = _status;
  }

  if (previous != _status) {
    LOG(INFO) << "Step '" << name << " [" << id << "]' status changed from "
              << previous << " to " << _status;

    notifyObservers();
  }

  return previous;
}


bool Step::reset(const Status& _status)
{
  Status previous;
  bool cleared = false;

  synchronized (mutex) {
    previous = status;
    status = _status;

    if (!errors.empty()) {
      errors.clear();
      cleared = true;
    }
  }

  if (previous == _status && !cleared) {
    return false;
  }

  LOG(INFO) << "Step '" << name << " [" << id << "]' reset from "
            << previous << " to " << _status
            << (cleared ? ", errors cleared" : "");

  notifyObservers();

  return true;
}


void Step::addError(const string& error)
{
  LOG(ERROR) << "Step '" << name << " [" << id << "]' failed: " << error;

  synchronized (mutex) {
    errors.push_back(error);
  }

  notifyObservers();
}

} // namespace plan {
} // namespace conductor {
