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

#ifndef __CONDUCTOR_PLAN_PARENT_ELEMENT_HPP__
#define __CONDUCTOR_PLAN_PARENT_ELEMENT_HPP__

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <mesos/mesos.hpp>
#include <mesos/type_utils.hpp>

#include <process/owned.hpp>

#include <stout/foreach.hpp>
#include <stout/hashset.hpp>
#include <stout/stringify.hpp>

#include <conductor/plan/element.hpp>
#include <conductor/plan/status.hpp>
#include <conductor/plan/strategy.hpp>

namespace conductor {
namespace plan {

/**
 * The behavior shared by every element which owns children: status
 * aggregation, cascading of restart/forceComplete/updates, and
 * interruption through the strategy. `Phase` and `Plan` each hold one
 * of these next to their own identity and forward to it.
 *
 * The children are fixed at construction. Null children are a
 * modeling error: they are dropped and the element reports `ERROR`
 * for the rest of its life.
 *
 * @param C the type of the children.
 */
template <typename C>
class ParentElement
{
public:
  ParentElement(
      const std::string& _name,
      const std::vector<std::shared_ptr<C>>& _children,
      const process::Owned<Strategy<C>>& _strategy,
      const std::vector<std::string>& _errors)
    : name(_name),
      strategy(_strategy),
      errors(_errors),
      malformed(false)
  {
    CHECK_NOTNULL(strategy.get());

    foreach (const std::shared_ptr<C>& child, _children) {
      if (child.get() == nullptr) {
        LOG(ERROR) << "Dropping null child of '" << name << "'";
        malformed = true;
        continue;
      }

      children.push_back(child);
    }
  }

  const std::vector<std::shared_ptr<C>>& getChildren() const
  {
    return children;
  }

  Strategy<C>& getStrategy() const
  {
    return *strategy;
  }

  // NOTE: Ordering matters throughout this function, the first
  // matching rule wins. This must never call the status of the
  // element's own parent, which would recurse.
  Status getStatus() const
  {
    Status result;

    if (!getErrors().empty() || anyHaveStatus(Status::ERROR, children)) {
      result = Status::ERROR;
      VLOG(1) << "(" << name << " status=" << result << ") "
              << "Elements contain errors";
    } else if (malformed) {
      result = Status::ERROR;
      LOG(ERROR) << "(" << name << " status=" << result << ") "
                 << "Parent element was constructed with null children";
    } else if (allHaveStatus(Status::COMPLETE, children)) {
      result = Status::COMPLETE;
      VLOG(1) << "(" << name << " status=" << result << ") "
              << "All elements have status: " << Status::COMPLETE;
    } else if (strategy->isInterrupted()) {
      result = Status::WAITING;
      VLOG(1) << "(" << name << " status=" << result << ") "
              << "Parent element is interrupted";
    } else if (anyHaveStatus(Status::PREPARED, children)) {
      result = Status::IN_PROGRESS;
      VLOG(1) << "(" << name << " status=" << result << ") "
              << "At least one element has status: " << Status::PREPARED;
    } else {
      const std::vector<std::shared_ptr<C>> candidates =
        strategy->getCandidates(children, hashset<std::string>());

      if (anyHaveStatus(Status::WAITING, candidates)) {
        result = Status::WAITING;
        VLOG(1) << "(" << name << " status=" << result << ") "
                << "At least one candidate has status: " << Status::WAITING;
      } else if (anyHaveStatus(Status::IN_PROGRESS, candidates)) {
        result = Status::IN_PROGRESS;
        VLOG(1) << "(" << name << " status=" << result << ") "
                << "At least one candidate has status: "
                << Status::IN_PROGRESS;
      } else if (anyHaveStatus(Status::COMPLETE, children) &&
                 anyHaveStatus(Status::PENDING, candidates)) {
        result = Status::IN_PROGRESS;
        VLOG(1) << "(" << name << " status=" << result << ") "
                << "At least one element has status " << Status::COMPLETE
                << " and one candidate has status " << Status::PENDING;
      } else if (anyHaveStatus(Status::COMPLETE, children) &&
                 anyHaveStatus(Status::STARTING, candidates)) {
        result = Status::IN_PROGRESS;
        VLOG(1) << "(" << name << " status=" << result << ") "
                << "At least one element has status " << Status::COMPLETE
                << " and one candidate has status " << Status::STARTING;
      } else if (!candidates.empty() &&
                 anyHaveStatus(Status::PENDING, candidates)) {
        result = Status::PENDING;
        VLOG(1) << "(" << name << " status=" << result << ") "
                << "At least one candidate has status: " << Status::PENDING;
      } else if (anyHaveStatus(Status::WAITING, children)) {
        result = Status::WAITING;
        VLOG(1) << "(" << name << " status=" << result << ") "
                << "At least one element has status: " << Status::WAITING;
      } else if (anyHaveStatus(Status::STARTING, candidates)) {
        result = Status::STARTING;
        VLOG(1) << "(" << name << " status=" << result << ") "
                << "At least one candidate has status: " << Status::STARTING;
      } else {
        result = Status::ERROR;
        LOG(WARNING) << "(" << name << " status=" << result << ") "
                     << "Unexpected state. Children: " << describe();
      }
    }

    return result;
  }

  // The errors of the element itself followed by those of every child,
  // in declaration order.
  std::vector<std::string> getErrors() const
  {
    std::vector<std::string> result = errors;

    foreach (const std::shared_ptr<C>& child, children) {
      const std::vector<std::string> childErrors = child->getErrors();
      result.insert(result.end(), childErrors.begin(), childErrors.end());
    }

    return result;
  }

  bool isInterrupted() const
  {
    return strategy->isInterrupted();
  }

  // Whether any child touches one of the `dirtyAssets`.
  bool hasConflicts(const hashset<std::string>& dirtyAssets) const
  {
    foreach (const std::shared_ptr<C>& child, children) {
      if (child->hasConflicts(dirtyAssets)) {
        return true;
      }
    }

    return false;
  }

  void update(const mesos::TaskStatus& status)
  {
    VLOG(1) << "Updating " << name << " with status of task "
            << status.task_id() << " in state " << status.state();

    foreach (const std::shared_ptr<C>& child, children) {
      child->update(status);
    }
  }

  void updateParameters(const std::map<std::string, std::string>& parameters)
  {
    foreach (const std::shared_ptr<C>& child, children) {
      child->updateParameters(parameters);
    }
  }

  std::vector<Element*> restart()
  {
    LOG(INFO) << "Restarting elements within " << name << ": " << describe();

    std::vector<Element*> modified;
    foreach (const std::shared_ptr<C>& child, children) {
      const std::vector<Element*> changed = child->restart();
      modified.insert(modified.end(), changed.begin(), changed.end());
    }

    return modified;
  }

  std::vector<Element*> forceComplete()
  {
    LOG(INFO) << "Forcing completion of elements within " << name << ": "
              << describe();

    std::vector<Element*> modified;
    foreach (const std::shared_ptr<C>& child, children) {
      const std::vector<Element*> changed = child->forceComplete();
      modified.insert(modified.end(), changed.begin(), changed.end());
    }

    return modified;
  }

private:
  std::string describe() const
  {
    std::string result = "[";
    foreach (const std::shared_ptr<C>& child, children) {
      if (result.size() > 1) {
        result += ", ";
      }
      result += stringify(*child);
    }
    return result + "]";
  }

  const std::string name;
  std::vector<std::shared_ptr<C>> children;
  process::Owned<Strategy<C>> strategy;
  const std::vector<std::string> errors;
  bool malformed;
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_PARENT_ELEMENT_HPP__
