/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <fc/exception/exception.hpp>

#include <functional>

namespace curio {
   namespace db {

      struct by_id;

      /**
       *  @brief Type-erased interface that lets the undo database drive every index
       *
       *  While tracking, an index remembers the objects it created and the first
       *  prior value of every object it modified, so that undo() can restore the
       *  exact state at begin_undo().
       */
      class abstract_index {
      public:
         virtual ~abstract_index() = default;

         virtual void begin_undo() = 0;
         virtual void undo() = 0;
         virtual void commit() = 0;
      };

      template<typename ObjectType>
      class index : public abstract_index {
      public:
         typedef ObjectType object_type;
         typedef typename ObjectType::id_type id_type;

         virtual const object_type &create(const std::function<void(object_type &)> &constructor) = 0;

         virtual void modify(const object_type &obj, const std::function<void(object_type &)> &m) = 0;

         virtual const object_type *find(id_type id) const = 0;

         const object_type &get(id_type id) const {
            const object_type *result = find(id);
            FC_ASSERT(result != nullptr, "Unknown object ${id}", ("id", id.instance));
            return *result;
         }

         virtual uint64_t size() const = 0;
      };

   }
} // curio::db
