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
#include <curio/db/undo_database.hpp>

namespace curio {
   namespace db {

      void undo_database::add_index(abstract_index *idx) {
         FC_ASSERT(idx != nullptr);
         FC_ASSERT(!_active, "Indexes may not be added while an undo session is active");
         _indexes.push_back(idx);
      }

      undo_database::session undo_database::start_undo_session() {
         FC_ASSERT(!_active, "Nested undo sessions are not supported");
         for (abstract_index *idx : _indexes)
            idx->begin_undo();
         _active = true;
         return session(*this);
      }

      void undo_database::undo() {
         for (abstract_index *idx : _indexes)
            idx->undo();
         _active = false;
      }

      void undo_database::commit() {
         for (abstract_index *idx : _indexes)
            idx->commit();
         _active = false;
      }

   }
} // curio::db
