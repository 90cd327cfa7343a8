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

#include "unit.hpp"

#include "logger.hpp"
#include "scoped_lock.hpp"

#include <stdio.h>
#include <string.h>

using namespace cequel::internal;

Unit::Unit()
    : output_log_level_(CEQUEL_LOG_DISABLED)
    , logging_criteria_count_(0) {
  uv_mutex_init(&mutex_);
  Logger::set_log_level(CEQUEL_LOG_TRACE);
  Logger::set_callback(on_log, this);
}

Unit::~Unit() {
  Logger::set_log_level(CEQUEL_LOG_DISABLED);
  Logger::set_callback(NULL, NULL);
  uv_mutex_destroy(&mutex_);
}

void Unit::set_output_log_level(CequelLogLevel output_log_level) {
  output_log_level_ = output_log_level;
}

void Unit::add_logging_critera(const String& criteria,
                               CequelLogLevel severity /*= CEQUEL_LOG_LAST_ENTRY*/) {
  ScopedMutex l(&mutex_);
  logging_criteria_[severity].push_back(criteria);
}

int Unit::logging_criteria_count() {
  ScopedMutex l(&mutex_);
  return logging_criteria_count_;
}

void Unit::reset_logging_criteria() {
  ScopedMutex l(&mutex_);
  logging_criteria_.clear();
  logging_criteria_count_ = 0;
}

void Unit::on_log(const CequelLogMessage* message, void* data) {
  Unit* instance = static_cast<Unit*>(data);

  if (message->severity <= instance->output_log_level_) {
    fprintf(stderr, "%u.%03u [%s] (%s:%d:%s): %s\n",
            static_cast<unsigned int>(message->time_ms / 1000),
            static_cast<unsigned int>(message->time_ms % 1000),
            cequel_log_level_string(message->severity), message->file, message->line,
            message->function, message->message);
  }

  // Determine if the log message matches any of the criteria
  ScopedMutex l(&instance->mutex_);
  for (Map<CequelLogLevel, Vector<String> >::const_iterator
           level_it = instance->logging_criteria_.begin(),
           level_end = instance->logging_criteria_.end();
       level_it != level_end; ++level_it) {
    CequelLogLevel level = level_it->first;
    const Vector<String>& criteria = level_it->second;
    for (Vector<String>::const_iterator it = criteria.begin(), end = criteria.end(); it != end;
         ++it) {
      if ((level == CEQUEL_LOG_LAST_ENTRY || level == message->severity) &&
          strstr(message->message, it->c_str()) != NULL) {
        ++instance->logging_criteria_count_;
      }
    }
  }
}
