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

#include <curio/db/index.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

#include <map>
#include <set>

namespace curio {
   namespace db {

      using boost::multi_index_container;
      using namespace boost::multi_index;

      /**
       *  @brief An index over a Boost.MultiIndex container of objects
       *
       *  Object instances are allocated sequentially starting at 1 and objects are
       *  never removed.  The container must have a unique by_id index on the id member.
       */
      template<typename ObjectType, typename MultiIndexType>
      class generic_index : public index<ObjectType> {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType object_type;
         typedef typename ObjectType::id_type id_type;

         const object_type &create(const std::function<void(object_type &)> &constructor) override {
            object_type item;
            item.id = id_type(_next_id);
            constructor(item);
            auto insert_result = _indices.insert(std::move(item));
            FC_ASSERT(insert_result.second, "Could not create object! Most likely a uniqueness constraint is violated.");
            if (_tracking)
               _new_ids.insert(_next_id);
            ++_next_id;
            return *insert_result.first;
         }

         void modify(const object_type &obj, const std::function<void(object_type &)> &m) override {
            if (_tracking && _new_ids.find(obj.id.instance) == _new_ids.end())
               _old_values.emplace(obj.id.instance, obj);

            const object_type backup = obj;
            auto itr = _indices.find(obj.id);
            FC_ASSERT(itr != _indices.end(), "Could not modify object, it is not in the index");
            bool ok = _indices.modify(itr, [&m](object_type &o) { m(o); },
                                      [&backup](object_type &o) { o = backup; });
            FC_ASSERT(ok, "Could not modify object, most likely a uniqueness constraint was violated");
         }

         const object_type *find(id_type id) const override {
            auto itr = _indices.find(id);
            if (itr == _indices.end())
               return nullptr;
            return &*itr;
         }

         uint64_t size() const override { return _indices.size(); }

         const index_type &indices() const { return _indices; }

         void begin_undo() override {
            _tracking = true;
            _saved_next_id = _next_id;
            _new_ids.clear();
            _old_values.clear();
         }

         void undo() override {
            if (!_tracking)
               return;
            for (const uint64_t instance : _new_ids)
               _indices.erase(id_type(instance));
            for (const auto &entry : _old_values) {
               auto itr = _indices.find(id_type(entry.first));
               _indices.replace(itr, entry.second);
            }
            _next_id = _saved_next_id;
            commit();
         }

         void commit() override {
            _tracking = false;
            _new_ids.clear();
            _old_values.clear();
         }

      private:
         index_type _indices;
         uint64_t _next_id = 1;

         bool _tracking = false;
         uint64_t _saved_next_id = 1;
         std::set<uint64_t> _new_ids;
         std::map<uint64_t, object_type> _old_values;
      };

   }
} // curio::db
