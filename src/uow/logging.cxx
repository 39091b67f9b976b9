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

#include "logging.hxx"

#include <spdlog/sinks/stdout_sinks.h>

namespace uow
{
    static std::shared_ptr<spdlog::logger> init_uow_log()
    {
        auto logger = spdlog::get(UOW_LOG);
        if (!logger) {
            logger = spdlog::stdout_logger_mt(UOW_LOG);
        }
        logger->set_pattern(UOW_LOGGER_PATTERN);
        return logger;
    }

    std::shared_ptr<spdlog::logger> uow_log = init_uow_log();

    spdlog::level::level_enum uow_to_spdlog_level(log_level level)
    {
        switch (level) {
            case log_level::TRACE:
                return spdlog::level::trace;
            case log_level::DEBUG:
                return spdlog::level::debug;
            case log_level::INFO:
                return spdlog::level::info;
            case log_level::WARN:
                return spdlog::level::warn;
            case log_level::ERROR:
                return spdlog::level::err;
            case log_level::CRITICAL:
                return spdlog::level::critical;
            default:
                return spdlog::level::off;
        }
    }

    void set_uow_log_level(log_level level)
    {
        uow_log->set_level(uow_to_spdlog_level(level));
    }

    void create_loggers(log_level level, spdlog::sink_ptr sink)
    {
        spdlog::drop(UOW_LOG);
        if (sink) {
            uow_log = std::make_shared<spdlog::logger>(UOW_LOG, sink);
            spdlog::register_logger(uow_log);
        } else {
            uow_log = spdlog::stdout_logger_mt(UOW_LOG);
        }
        uow_log->set_pattern(UOW_LOGGER_PATTERN);
        set_uow_log_level(level);
    }
} // namespace uow
