/**
 * Copyright (c) 2026, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file injector.hh
 */

#ifndef logpane_injector_hh
#define logpane_injector_hh

#include <memory>
#include <type_traits>

#include "base/lp_log.hh"

/**
 * A minimal service locator.  Components that need shared configuration or
 * services look them up with injector::get<const T&>() instead of having
 * the objects threaded through every constructor.  Bindings are made with
 * injector::bind<T> from "injector.bind.hh".
 */
namespace injector {

enum class scope {
    undefined,
    singleton,
};

template<typename T, typename... Annotations>
struct singleton_storage {
    static scope get_scope() { return ss_scope; }

    static T* get() { return ss_data; }

    static std::shared_ptr<T> get_owner() { return ss_owner; }

protected:
    static scope ss_scope;
    static T* ss_data;
    static std::shared_ptr<T> ss_owner;
};

template<typename T, typename... Annotations>
T* singleton_storage<T, Annotations...>::ss_data = nullptr;

template<typename T, typename... Annotations>
scope singleton_storage<T, Annotations...>::ss_scope = scope::undefined;

template<typename T, typename... Annotations>
std::shared_ptr<T> singleton_storage<T, Annotations...>::ss_owner;

template<typename T,
         typename... Annotations,
         std::enable_if_t<std::is_reference<T>::value, bool> = true>
T
get()
{
    using plain_t = std::remove_const_t<std::remove_reference_t<T>>;

    auto* retval = singleton_storage<plain_t, Annotations...>::get();
    require(retval != nullptr);

    return *retval;
}

template<typename T,
         typename... Annotations,
         std::enable_if_t<std::is_pointer<T>::value, bool> = true>
T
get()
{
    using plain_t = std::remove_const_t<std::remove_pointer_t<T>>;

    return singleton_storage<plain_t, Annotations...>::get();
}

}  // namespace injector

#endif
