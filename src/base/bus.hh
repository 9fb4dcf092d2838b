/**
 * Copyright (c) 2025, Timothy Stack
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
 */

#ifndef rangetail_bus_hh
#define rangetail_bus_hh

#include <algorithm>
#include <vector>

#include "rangetail_log.hh"

/**
 * A list of non-owning pointers to components that want to be told about
 * things happening on the owner.  Components must be detached before they
 * are destroyed.
 */
template<typename T>
class bus {
public:
    bus() = default;

    virtual ~bus() = default;

    bus(const bus<T>&) = delete;

    void attach(T* component)
    {
        require(component != nullptr);

        this->b_components.emplace_back(component);
    }

    void detach(T* component)
    {
        auto iter = std::find(
            this->b_components.begin(), this->b_components.end(), component);
        require(iter != this->b_components.end());

        this->b_components.erase(iter);
    }

    bool empty() const { return this->b_components.empty(); }

    size_t size() const { return this->b_components.size(); }

    template<typename F>
    void notify(F func) const
    {
        // copy in case a component detaches itself during the callback
        auto components = this->b_components;

        for (auto* comp : components) {
            func(*comp);
        }
    }

protected:
    std::vector<T*> b_components;
};

#endif
