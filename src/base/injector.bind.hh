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
 * @file injector.bind.hh
 */

#ifndef logpane_injector_bind_hh
#define logpane_injector_bind_hh

#include "injector.hh"

namespace injector {

template<typename T, typename... Annotations>
struct bind : singleton_storage<T, Annotations...> {
    static bool to_singleton() noexcept
    {
        singleton_storage<T, Annotations...>::ss_owner = std::make_shared<T>();
        singleton_storage<T, Annotations...>::ss_data
            = singleton_storage<T, Annotations...>::ss_owner.get();
        singleton_storage<T, Annotations...>::ss_scope = scope::singleton;
        return true;
    }

    static bool to_instance(T* data) noexcept
    {
        singleton_storage<T, Annotations...>::ss_data = data;
        singleton_storage<T, Annotations...>::ss_scope = scope::singleton;
        return true;
    }

    /**
     * Binding that is undone when the returned object goes out of scope,
     * used by tests that swap in their own configuration.
     */
    struct lifetime {
        lifetime() = default;
        lifetime(const lifetime&) = delete;
        lifetime(lifetime&& other) noexcept : l_prev(other.l_prev)
        {
            other.l_active = false;
        }

        ~lifetime()
        {
            if (this->l_active) {
                singleton_storage<T, Annotations...>::ss_data = this->l_prev;
            }
        }

        T* l_prev{nullptr};
        bool l_active{true};
    };

    static lifetime to_scoped_instance(T* data) noexcept
    {
        lifetime retval;

        retval.l_prev = singleton_storage<T, Annotations...>::ss_data;
        singleton_storage<T, Annotations...>::ss_data = data;
        singleton_storage<T, Annotations...>::ss_scope = scope::singleton;

        return retval;
    }
};

}  // namespace injector

#endif
