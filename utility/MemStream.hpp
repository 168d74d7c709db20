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

#ifndef TABSQL_UTILITY_MEM_STREAM_HPP_
#define TABSQL_UTILITY_MEM_STREAM_HPP_

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "utility/Macros.hpp"

#include "glog/logging.h"

namespace tabsql {

/** \addtogroup Utility
 *  @{
 */

/**
 * @brief A FILE* backed by a growable in-memory buffer. Used wherever output
 *        written with fprintf has to be captured as a string.
 **/
class MemStream {
 public:
  MemStream()
      : buffer_(nullptr),
        size_(0),
        file_(nullptr) {
    open();
  }

  ~MemStream() {
    close();
  }

  /**
   * @return The stream's file handle. Valid until reset() or destruction.
   **/
  FILE* file() {
    return file_;
  }

  /**
   * @brief Flushes the stream and copies out everything written so far.
   **/
  std::string str() {
    std::fflush(file_);
    return std::string(buffer_, size_);
  }

  /**
   * @brief Discards the buffered contents. The handle returned by file() is
   *        replaced.
   **/
  void reset() {
    close();
    open();
  }

 private:
  void open() {
    file_ = open_memstream(&buffer_, &size_);
    CHECK(file_ != nullptr) << "open_memstream failed";
  }

  void close() {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    std::free(buffer_);
    buffer_ = nullptr;
    size_ = 0;
  }

  char *buffer_;
  std::size_t size_;
  FILE *file_;

  DISALLOW_COPY_AND_ASSIGN(MemStream);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_UTILITY_MEM_STREAM_HPP_
