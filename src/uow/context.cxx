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

#include <uow/context.hxx>

namespace uow
{
    context context::with_deadline(clock::time_point deadline) const
    {
        context derived(*this);
        if (!derived.deadline_ || deadline < *derived.deadline_) {
            derived.deadline_ = deadline;
        }
        return derived;
    }

    context context::with_cancellation() const
    {
        context derived(*this);
        auto state = std::make_shared<cancellation>();
        state->parent = cancellation_;
        derived.cancellation_ = std::move(state);
        return derived;
    }

    context context::with_transaction(std::shared_ptr<uow::transaction> txn) const
    {
        context derived(*this);
        derived.transaction_ = std::move(txn);
        return derived;
    }

    void context::cancel() const
    {
        if (cancellation_) {
            cancellation_->cancelled.store(true);
        }
    }

    bool context::cancelled() const
    {
        for (const cancellation* state = cancellation_.get(); state != nullptr; state = state->parent.get()) {
            if (state->cancelled.load()) {
                return true;
            }
        }
        return false;
    }

    bool context::expired() const
    {
        return deadline_ && clock::now() >= *deadline_;
    }

    context::clock::duration context::remaining() const
    {
        if (!deadline_) {
            return clock::duration::max();
        }
        auto now = clock::now();
        if (*deadline_ <= now) {
            return clock::duration::zero();
        }
        return *deadline_ - now;
    }
} // namespace uow
