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

#include <vector>

namespace curio {
   namespace db {

      /**
       * @brief Tracks changes to every registered index so that a failed operation leaves no trace
       *
       * Only one session may be active at a time.  A session that is destroyed without
       * commit() restores every registered index to its state at session start.
       */
      class undo_database {
      public:
         class session {
         public:
            session(session &&mv)
               : _db(mv._db), _apply_undo(mv._apply_undo) {
               mv._apply_undo = false;
            }

            ~session() {
               if (_apply_undo)
                  _db.undo();
            }

            void commit() {
               if (_apply_undo)
                  _db.commit();
               _apply_undo = false;
            }

            void undo() {
               if (_apply_undo)
                  _db.undo();
               _apply_undo = false;
            }

         private:
            friend class undo_database;

            explicit session(undo_database &db) : _db(db) {}

            undo_database &_db;
            bool _apply_undo = true;
         };

         void add_index(abstract_index *idx);

         session start_undo_session();

         bool is_active() const { return _active; }

      private:
         void undo();

         void commit();

         std::vector<abstract_index *> _indexes;
         bool _active = false;
      };

   }
} // curio::db
