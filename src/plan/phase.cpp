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
#include <memory>
#include <string>
#include <vector>

#include <stout/foreach.hpp>

#include <conductor/plan/phase.hpp>

using process::Owned;

using std::map;
using std::shared_ptr;
using std::string;
using std::vector;

namespace conductor {
namespace plan {

Phase::Phase(
    const string& _name,
    const vector<shared_ptr<Step>>& steps,
    const Owned<Strategy<Step>>& strategy,
    const vector<string>& errors)
  : id(id::UUID::random()),
    name(_name),
    parent(_name, steps, strategy, errors)
{
  foreach (const shared_ptr<Step>& step, parent.getChildren()) {
    step->subscribe(this);
  }
}


Phase::~Phase()
{
  foreach (const shared_ptr<Step>& step, parent.getChildren()) {
    step->unsubscribe(this);
  }
}


const vector<shared_ptr<Step>>& Phase::getChildren() const
{
  return parent.getChildren();
}


Strategy<Step>& Phase::getStrategy() const
{
  return parent.getStrategy();
}


const id::UUID& Phase::getId() const
{
  return id;
}


const string& Phase::getName() const
{
  return name;
}


string Phase::getType() const
{
  return "Phase";
}


Status Phase::getStatus() const
{
  return parent.getStatus();
}


vector<string> Phase::getErrors() const
{
  return parent.getErrors();
}


bool Phase::interrupt()
{
  const bool changed = parent.getStrategy().interrupt();
  notifyObservers();
  return changed;
}


bool Phase::proceed()
{
  const bool changed = parent.getStrategy().proceed();
  notifyObservers();
  return changed;
}


bool Phase::isInterrupted() const
{
  return parent.isInterrupted();
}


void Phase::update(const mesos::TaskStatus& status)
{
  parent.update(status);
}


void Phase::updateParameters(const map<string, string>& parameters)
{
  parent.updateParameters(parameters);
}


vector<Element*> Phase::restart()
{
  return parent.restart();
}


vector<Element*> Phase::forceComplete()
{
  return parent.forceComplete();
}


bool Phase::hasConflicts(const hashset<string>& dirtyAssets) const
{
  return parent.hasConflicts(dirtyAssets);
}

} // namespace plan {
} // namespace conductor {
