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
#include <curio/chain/database.hpp>

namespace curio {
   namespace chain {

      const nft_object *database::find_nft(nft_id_type token) const {
         return find<nft_object>(token);
      }

      const nft_object &database::get_nft(nft_id_type token) const {
         const nft_object *nft = find_nft(token);
         CURIO_ASSERT(nft != nullptr, not_found_exception, "Token does not exist", ("token", token));
         return *nft;
      }

      const collection_object *database::find_collection(collection_id_type collection) const {
         return find<collection_object>(collection);
      }

      const collection_object &database::get_collection(collection_id_type collection) const {
         const collection_object *c = find_collection(collection);
         CURIO_ASSERT(c != nullptr, not_found_exception, "Invalid collection ID", ("collection", collection));
         return *c;
      }

      const collection_object *database::find_collection_by_name(const string &name) const {
         const auto &idx = get_index_type<collection_index>().indices().get<by_collection_name>();
         auto itr = idx.find(name);
         if (itr == idx.end())
            return nullptr;
         return &*itr;
      }

      uint64_t database::next_acquired_seq() {
         const global_property_object &gpo = get_global_properties();
         const uint64_t seq = gpo.next_acquired_seq;
         modify(gpo, [](global_property_object &g) {
            ++g.next_acquired_seq;
         });
         return seq;
      }

      void database::transfer_nft(const nft_object &token, const account_name_type &to) {
         CURIO_ASSERT(is_valid_account_name(to), invalid_input_exception,
                      "Invalid recipient", ("to", to));

         const uint64_t seq = next_acquired_seq();
         modify(token, [&to, seq](nft_object &obj) {
            obj.owner = to;
            obj.acquired_seq = seq;
         });

         push_event(nft_transferred_event{token.id, to});
      }

   }
} // curio::chain
