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

#include "../../src/uow/logging.hxx"
#include <uow/logging.hxx>
#include <uow/unit_of_work.hxx>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

class UnitOfWorkTestEnvironment : public ::testing::Environment
{
  public:
    void SetUp() override
    {
        // for tests, really chatty logs may be useful.
        uow::set_uow_log_level(uow::log_level::TRACE);
    }

    void TearDown() override
    {
        uow::uow_log->flush();
    }

    /**
     * Put the logger back the way SetUp left it, for tests which replaced it.
     */
    static void restore_logger()
    {
        uow::create_loggers(uow::log_level::TRACE);
    }
};
