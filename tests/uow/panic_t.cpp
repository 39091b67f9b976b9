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

#include "helpers.hxx"
#include "uow_env.h"
#include <uow/exceptions.hxx>
#include <uow/unit_of_work.hxx>

#include <gtest/gtest.h>
#include <stdexcept>

using namespace uow;

namespace
{
    struct not_an_error {
        int code;
    };

    std::string error_of(unit_of_work& work, const logic& fn)
    {
        try {
            work.run(fn);
        } catch (const recovered_panic& e) {
            return e.what();
        }
        ADD_FAILURE() << "run did not throw recovered_panic";
        return {};
    }
} // namespace

TEST(RecoveredPanic, StringPayloadIsPrefixed)
{
    auto log = std::make_shared<journal>();
    auto a = std::make_shared<fake_component>("a", log);
    auto b = std::make_shared<fake_component>("b", log);
    b->panic_in_operation("boom");
    auto work = unit_of_work::create(a, b);
    std::string result;
    auto err = error_of(work, [&](work_context& ctx) {
        result = a->operation(ctx.context_for(a));
        result = b->operation(ctx.context_for(b));
    });
    ASSERT_EQ("recovered: boom", err);
    ASSERT_EQ("tx a", result);
    ASSERT_TRUE(a->txn().rolled_back());
    ASSERT_TRUE(b->txn().rolled_back());
    ASSERT_FALSE(a->txn().committed());
    ASSERT_FALSE(b->txn().committed());
}

TEST(RecoveredPanic, ErrorPayloadIsPassedThrough)
{
    auto log = std::make_shared<journal>();
    auto a = std::make_shared<fake_component>("a", log);
    auto work = unit_of_work::create(a);
    EXPECT_THROW(
      {
          try {
              work.run([](work_context&) { throw std::logic_error("boom"); });
          } catch (const recovered_panic&) {
              ADD_FAILURE() << "std::exception should not be wrapped";
              throw;
          } catch (const std::logic_error& e) {
              EXPECT_STREQ("boom", e.what());
              throw;
          }
      },
      std::logic_error);
    ASSERT_TRUE(a->txn().rolled_back());
}

TEST(RecoveredPanic, CharPointerPayload)
{
    auto work = unit_of_work::create(std::make_shared<nop_component>());
    ASSERT_EQ("recovered: boom", error_of(work, [](work_context&) { throw "boom"; }));
}

TEST(RecoveredPanic, IntegralPayload)
{
    auto work = unit_of_work::create(std::make_shared<nop_component>());
    ASSERT_EQ("recovered: 3", error_of(work, [](work_context&) { throw 3; }));
}

TEST(RecoveredPanic, UnknownPayload)
{
    auto work = unit_of_work::create(std::make_shared<nop_component>());
    ASSERT_EQ("recovered: unknown exception", error_of(work, [](work_context&) { throw not_an_error{ 42 }; }));
    ASSERT_EQ(run_state::FAILED, work.state());
}

TEST(RecoveredPanic, FromBegin)
{
    struct panicking : public transactional {
        std::shared_ptr<transaction> begin() override
        {
            throw std::string("no connection");
        }
    };
    auto log = std::make_shared<journal>();
    auto a = std::make_shared<fake_component>("a", log);
    auto work = unit_of_work::create(a, std::make_shared<panicking>());
    bool called = false;
    ASSERT_EQ("recovered: no connection", error_of(work, [&](work_context&) { called = true; }));
    ASSERT_FALSE(called);
    ASSERT_TRUE(a->txn().rolled_back());
}

TEST(RecoveredPanic, FromCommit)
{
    auto log = std::make_shared<journal>();
    auto a = std::make_shared<fake_component>("a", log);
    auto b = std::make_shared<fake_component>("b", log);
    a->txn().commit_error = std::make_exception_ptr(7);
    auto work = unit_of_work::create(a, b);
    ASSERT_EQ("recovered: 7", error_of(work, [](work_context&) {}));
    ASSERT_TRUE(a->txn().rolled_back());
    ASSERT_TRUE(b->txn().rolled_back());
    ASSERT_FALSE(b->txn().committed());
}

TEST(Recover, KeepsStdExceptions)
{
    auto original = std::make_exception_ptr(std::runtime_error("kept"));
    ASSERT_EQ(original, recover(original));
}

TEST(Recover, WrapsEverythingElse)
{
    auto recovered = recover(std::make_exception_ptr(std::string("wrapped")));
    try {
        std::rethrow_exception(recovered);
    } catch (const recovered_panic& e) {
        ASSERT_STREQ("recovered: wrapped", e.what());
        return;
    }
    FAIL() << "expected recovered_panic";
}
