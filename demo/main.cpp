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

#include <stdio.h>
#include <stdlib.h>

#include "cassandra_driver.hpp"
#include "keyspace.hpp"

using namespace cequel::internal;
using namespace cequel::internal::core;

void print_error(const char* message, const Error& error) {
  fprintf(stderr, "%s: %s\n", message, error.to_string().c_str());
}

CequelError insert_posts(Batch* batch) {
  const char* titles[] = { "First post", "Second post", "Third post" };
  for (int i = 0; i < 3; ++i) {
    ValueVec values;
    values.push_back(Value::int32(i));
    values.push_back(Value::text(titles[i]));
    CequelError rc = batch->append(
        Statement::write("INSERT INTO posts (id, title) VALUES (?, ?)", values), NULL);
    if (rc != CEQUEL_OK) return rc;
  }
  return CEQUEL_OK;
}

int main(int argc, char* argv[]) {
  Options options;
  Error error;

  if (argc > 1) {
    if (Options::from_json_file(argv[1], &options, &error) != CEQUEL_OK) {
      print_error("Unable to read configuration", error);
      return EXIT_FAILURE;
    }
  } else {
    options.set_string("host", "127.0.0.1");
  }

  cequel_log_set_level(CEQUEL_LOG_INFO);
  CassandraDriver::forward_logging();

  Driver::Ptr driver(new CassandraDriver());
  Keyspace::Ptr keyspace;
  if (Keyspace::connect(driver, options, &keyspace, &error) != CEQUEL_OK) {
    print_error("Invalid configuration", error);
    return EXIT_FAILURE;
  }

  // Without a configured keyspace, create one to play in
  if (keyspace->name().is_null()) {
    Statement::ConstPtr statements[] = {
      Statement::write("CREATE KEYSPACE IF NOT EXISTS cequel_demo WITH replication = "
                       "{ 'class': 'SimpleStrategy', 'replication_factor': '1' }"),
      Statement::write("CREATE TABLE IF NOT EXISTS cequel_demo.posts "
                       "(id int PRIMARY KEY, title text)")
    };
    for (size_t i = 0; i < sizeof(statements) / sizeof(statements[0]); ++i) {
      if (!keyspace->execute(statements[i], &error)) {
        print_error("Unable to create schema", error);
        return EXIT_FAILURE;
      }
    }
    options.set_string("keyspace", "cequel_demo");
    if (Keyspace::connect(driver, options, &keyspace, &error) != CEQUEL_OK) {
      print_error("Invalid configuration", error);
      return EXIT_FAILURE;
    }
  }

  bool exists = false;
  if (keyspace->exists(&exists, &error) != CEQUEL_OK) {
    print_error("Unable to check keyspace", error);
    return EXIT_FAILURE;
  }
  printf("Keyspace %s %s\n", keyspace->name().value().c_str(),
         exists ? "exists" : "does not exist");

  BatchOptions batch_options;
  batch_options.consistency = CEQUEL_CONSISTENCY_QUORUM;
  batch_options.auto_apply.set(2);
  if (keyspace->batch(batch_options, insert_posts, &error) != CEQUEL_OK) {
    print_error("Unable to apply batch", error);
    return EXIT_FAILURE;
  }

  Response::Ptr response(keyspace->execute(Statement::read("SELECT id, title FROM posts"),
                                           CEQUEL_CONSISTENCY_ONE, &error));
  if (!response) {
    print_error("Unable to read posts", error);
    return EXIT_FAILURE;
  }
  printf("Read %u posts\n",
         static_cast<unsigned int>(static_cast<CassandraResponse*>(response.get())->row_count()));

  keyspace->close();
  return EXIT_SUCCESS;
}
