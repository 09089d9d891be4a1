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

#ifndef __CONDUCTOR_PLAN_INTERRUPTIBLE_HPP__
#define __CONDUCTOR_PLAN_INTERRUPTIBLE_HPP__

namespace conductor {
namespace plan {

/**
 * Implemented by anything which may be flagged as interrupted. The
 * interrupted flag is an override on top of any status the object
 * may otherwise have: an interrupted object does not continue work
 * beyond its current point until `proceed()` is called.
 */
class Interruptible
{
public:
  virtual ~Interruptible() {}

  /**
   * Stops any further work until `proceed()` is called.
   *
   * @return whether the call modified state, i.e. false if the
   *     object was already interrupted.
   */
  virtual bool interrupt() = 0;

  /**
   * Cancels a previous `interrupt()` and resumes pending work.
   *
   * @return whether the call modified state, i.e. false if the
   *     object was already proceeding.
   */
  virtual bool proceed() = 0;

  virtual bool isInterrupted() const = 0;
};

} // namespace plan {
} // namespace conductor {

#endif // __CONDUCTOR_PLAN_INTERRUPTIBLE_HPP__
