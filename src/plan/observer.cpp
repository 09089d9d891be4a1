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

#include <algorithm>
#include <mutex>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/synchronized.hpp>

#include <conductor/plan/observer.hpp>

namespace conductor {
namespace plan {

void Observable::subscribe(Observer* observer)
{
  CHECK_NOTNULL(observer);

  synchronized (mutex) {
    observers.push_back(observer);
  }
}


void Observable::unsubscribe(Observer* observer)
{
  synchronized (mutex) {
    observers.erase(
        std::remove(observers.begin(), observers.end(), observer),
        observers.end());
  }
}


void Observable::notifyObservers()
{
  std::vector<Observer*> subscribed;

  synchronized (mutex) {
    subscribed = observers;
  }

  foreach (Observer* observer, subscribed) {
    observer->updated(*this);
  }
}


void ChainedObserver::updated(const Observable& observable)
{
  notifyObservers();
}

} // namespace plan {
} // namespace conductor {
