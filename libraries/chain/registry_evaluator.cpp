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
#include <curio/chain/registry_evaluator.hpp>

namespace curio {
   namespace chain {
      void_result collection_create_evaluator::do_evaluate(const collection_create_operation &op) {
         try {
            const database &d = db();

            // Collection names are unique across the whole registry
            CURIO_ASSERT(d.find_collection_by_name(op.name) == nullptr, conflict_exception,
                         "Collection already exists", ("name", op.name));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      collection_id_type collection_create_evaluator::do_apply(const collection_create_operation &op) {
         try {
            database &d = db();

            const collection_object &obj = d.create<collection_object>([&op](collection_object &c) {
               c.name = op.name;
               c.creator = op.creator;
            });
            d.push_event(collection_created_event{obj.id});

            return obj.id;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result nft_mint_evaluator::do_evaluate(const nft_mint_operation &op) {
         try {
            const database &d = db();

            // Verify the existence of the collection
            d.get_collection(op.collection);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      nft_id_type nft_mint_evaluator::do_apply(const nft_mint_operation &op) {
         try {
            database &d = db();

            const uint64_t seq = d.next_acquired_seq();
            const nft_object &obj = d.create<nft_object>([&op, seq](nft_object &n) {
               n.collection = op.collection;
               n.name = op.name;
               n.mint_price = op.price;
               n.owner = op.issuer;
               n.acquired_seq = seq;
            });
            d.push_event(nft_minted_event{obj.id});

            return obj.id;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result nft_transfer_evaluator::do_evaluate(const nft_transfer_operation &op) {
         try {
            const database &d = db();

            const nft_object &token = d.get_nft(op.token);
            CURIO_ASSERT(token.owner == op.from, unauthorized_exception,
                         "Not token owner", ("owner", token.owner)("from", op.from));

            // An item held by the marketplace cannot change hands behind its back
            CURIO_ASSERT(!d.is_listed(op.token), conflict_exception,
                         "NFT is listed for sale", ("token", op.token));
            CURIO_ASSERT(!d.is_auctioned(op.token), conflict_exception,
                         "NFT is in an active auction", ("token", op.token));
            ptr_token_obj = &token;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result nft_transfer_evaluator::do_apply(const nft_transfer_operation &op) {
         try {
            db().transfer_nft(*ptr_token_obj, op.to);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }
   }
}
