/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 **/

#include "cli/OutputFile.hpp"

#include <cstdio>
#include <string>

#include "glog/logging.h"

namespace tabsql {

FilePtr OpenOutputFile(const std::string &path) {
  FilePtr file(std::fopen(path.c_str(), "w"), &std::fclose);
  if (file != nullptr) {
    LOG(INFO) << "Writing results to " << path;
  }
  return file;
}

int CloseOutputFile(FilePtr *file) {
  DCHECK(file != nullptr);
  if (*file == nullptr) {
    return 0;
  }
  return std::fclose(file->release());
}

}  // namespace tabsql
