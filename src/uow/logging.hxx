/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */
#pragma once

#include <memory>

#include <spdlog/spdlog.h>
#include <uow/logging.hxx>

// To avoid static initialization order issues, #define instead of static const
#define UOW_LOG "uow"
#define UOW_LOGGER_PATTERN "[%H:%M:%S.%e][%n][%l][t:%t] %v"

namespace uow
{
    extern std::shared_ptr<spdlog::logger> uow_log;

    spdlog::level::level_enum uow_to_spdlog_level(log_level level);
} // namespace uow
