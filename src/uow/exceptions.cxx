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

#include <uow/exceptions.hxx>

#include <boost/core/demangle.hpp>

namespace uow
{
    std::string demangled_name(const std::type_info& info)
    {
        return boost::core::demangle(info.name());
    }

    std::exception_ptr recover(std::exception_ptr err)
    {
        try {
            std::rethrow_exception(err);
        } catch (const std::exception&) {
            return err;
        } catch (const char* payload) {
            return std::make_exception_ptr(recovered_panic(payload == nullptr ? "<null>" : payload));
        } catch (const std::string& payload) {
            return std::make_exception_ptr(recovered_panic(payload));
        } catch (int payload) {
            return std::make_exception_ptr(recovered_panic(std::to_string(payload)));
        } catch (long payload) {
            return std::make_exception_ptr(recovered_panic(std::to_string(payload)));
        } catch (long long payload) {
            return std::make_exception_ptr(recovered_panic(std::to_string(payload)));
        } catch (unsigned int payload) {
            return std::make_exception_ptr(recovered_panic(std::to_string(payload)));
        } catch (unsigned long payload) {
            return std::make_exception_ptr(recovered_panic(std::to_string(payload)));
        } catch (unsigned long long payload) {
            return std::make_exception_ptr(recovered_panic(std::to_string(payload)));
        } catch (...) {
            return std::make_exception_ptr(recovered_panic("unknown exception"));
        }
    }
} // namespace uow
