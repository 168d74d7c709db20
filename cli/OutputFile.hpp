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

#ifndef TABSQL_CLI_OUTPUT_FILE_HPP_
#define TABSQL_CLI_OUTPUT_FILE_HPP_

#include <cstdio>
#include <memory>
#include <string>

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief An owned FILE*, closed with fclose() when released.
 **/
typedef std::unique_ptr<FILE, int (*)(FILE*)> FilePtr;

/**
 * @brief Create or truncate path for writing results.
 *
 * @return The open file, or an empty FilePtr with errno set on failure.
 **/
FilePtr OpenOutputFile(const std::string &path);

/**
 * @brief Flush and close file, reporting any write error that surfaces at
 *        close time. file is empty afterwards.
 *
 * @return 0 on success, EOF on failure with errno set.
 **/
int CloseOutputFile(FilePtr *file);

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_OUTPUT_FILE_HPP_
