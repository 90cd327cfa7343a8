/*
  Copyright (c) DataStax, Inc.

  Licensed under the Apache License, Version 2.0 (the "License");
  you may not use this file except in compliance with the License.
  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
*/

#ifndef UNIT_TEST_HPP
#define UNIT_TEST_HPP

#include "cequel.h"
#include "map.hpp"
#include "string.hpp"
#include "vector.hpp"

#include <gtest/gtest.h>
#include <uv.h>

class Unit : public testing::Test {
public:
  /**
   * Installs a log callback that matches messages against the registered
   * criteria. Everything is captured at TRACE; nothing is printed unless
   * set_output_log_level() is raised.
   */
  Unit();

  /**
   * Restores the default logger.
   */
  virtual ~Unit();

  /**
   * Set the level at which captured messages are also printed to stderr.
   *
   * @param output_log_level The log level.
   */
  void set_output_log_level(CequelLogLevel output_log_level);

  /**
   * Add criteria to the search criteria for incoming log messages
   *
   * @param criteria Criteria to add
   * @param severity Only match messages of this level; CEQUEL_LOG_LAST_ENTRY
   * matches any level.
   */
  void add_logging_critera(const cequel::internal::String& criteria,
                           CequelLogLevel severity = CEQUEL_LOG_LAST_ENTRY);

  /**
   * Get the number of log messages that matched the search criteria
   *
   * @return Number of matched log messages
   */
  int logging_criteria_count();

  /**
   * Clear the logging criteria and the count of matched messages.
   */
  void reset_logging_criteria();

private:
  static void on_log(const CequelLogMessage* message, void* data);

private:
  uv_mutex_t mutex_;
  CequelLogLevel output_log_level_;
  cequel::internal::Map<CequelLogLevel, cequel::internal::Vector<cequel::internal::String> >
      logging_criteria_;
  int logging_criteria_count_;
};

#endif // UNIT_TEST_HPP
