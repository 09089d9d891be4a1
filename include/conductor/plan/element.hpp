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

#ifndef __CONDUCTOR_PLAN_ELEMENT_HPP__
#define __CONDUCTOR_PLAN_ELEMENT_HPP__

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <mesos/mesos.hpp>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/uuid.hpp>

#include <conductor/plan/interruptible.hpp>
#include <conductor/plan/status.hpp>

namespace conductor {
namespace plan {

/**
 * A node of a plan: a `Plan`, a `Phase` or a `Step`.
 *
 * The id and the name of an element never change after construction.
 * The name is unique among the children of the element's parent.
 */
class Element : public Interruptible
{
public:
  ~Element() override {}

  virtual const id::UUID& getId() const = 0;

  virtual const std::string& getName() const = 0;

  // A short tag naming the kind of element, e.g. "Plan", "Phase" or
  // the name of the concrete step class.
  virtual std::string getType() const = 0;

  virtual Status getStatus() const = 0;

  // Returns the errors of this element followed by those of all its
  // descendants, in declaration order.
  virtual std::vector<std::string> getErrors() const = 0;

  // Passes a task status update down to the element. Elements which
  // do not own the task are expected to ignore it.
  virtual void update(const mesos::TaskStatus& status) = 0;

  virtual void updateParameters(
      const std::map<std::string, std::string>& parameters) = 0;

  // Resets the element (and its descendants) to `PENDING`, dropping
  // the errors recorded by steps. Returns the steps which changed.
  virtual std::vector<Element*> restart() = 0;

  // Forces the element (and its descendants) to `COMPLETE`, dropping
  // the errors recorded by steps. Returns the steps which changed.
  virtual std::vector<Element*> forceComplete() = 0;

  // Whether the work of this element touches any of the given assets.
  virtual bool hasConflicts(const hashset<std::string>& dirtyAssets) const = 0;

  // An element is eligible for work if it is not interrupted and does
  // not touch an asset which is being worked on elsewhere.
  virtual bool isEligible(const hashset<std::string>& dirtyAssets) const;

  bool isPending() const { return getStatus() == Status::PENDING; }
  bool isPrepared() const { return getStatus() == Status::PREPARED; }
  bool isStarting() const { return getStatus() == Status::STARTING; }
  bool isInProgress() const { return getStatus() == Status::IN_PROGRESS; }
  bool isWaiting() const { return getStatus() == Status::WAITING; }
  bool isComplete() const { return getStatus() == Status::COMPLETE; }
  bool hasErrors() const { return getStatus() == Status::ERROR; }
};


template <typename T>
bool anyHaveStatus(
    const Status& status,
    const std::vector<std::shared_ptr<T>>& elements)
{
  foreach (const std::shared_ptr<T>& element, elements) {
    if (element->getStatus() == status) {
      return true;
    }
  }

  return false;
}


// NOTE: Vacuously true for an empty list.
template <typename T>
bool allHaveStatus(
    const Status& status,
    const std::vector<std::shared_ptr<T>>& elements)
{
  foreach (const std::shared_ptr<T>& element, elements) {
    if (element->getStatus() != status) {
      return false;
    }
  }

  return true;
}


std::ostream& operator<<(std::ostream& stream, const Element& element);

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_ELEMENT_HPP__
