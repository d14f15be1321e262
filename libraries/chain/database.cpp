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

#include <curio/chain/account_evaluator.hpp>
#include <curio/chain/market_evaluator.hpp>
#include <curio/chain/registry_evaluator.hpp>

namespace curio {
   namespace chain {

      database::database(const chain_parameters &params)
         : _params(params) {
         _params.validate();
         initialize_indexes();
         initialize_evaluators();

         create<global_property_object>([](global_property_object &gpo) {
            gpo.time = time_point_sec(fc::time_point::now());
         });
      }

      database::~database() {}

      void database::initialize_indexes() {
         _indexes.resize(OBJECT_TYPE_COUNT);

         add_index<collection_index>();
         add_index<nft_index>();
         add_index<listing_index>();
         add_index<auction_index>();
         add_index<account_index>();
         add_index<pending_credit_index>();
         add_index<global_property_index>();
      }

      void database::initialize_evaluators() {
         _operation_evaluators.resize(operation::count());

         register_evaluator<collection_create_evaluator>();
         register_evaluator<nft_mint_evaluator>();
         register_evaluator<nft_transfer_evaluator>();
         register_evaluator<listing_create_evaluator>();
         register_evaluator<listing_cancel_evaluator>();
         register_evaluator<nft_buy_evaluator>();
         register_evaluator<auction_create_evaluator>();
         register_evaluator<auction_bid_evaluator>();
         register_evaluator<auction_finalize_evaluator>();
         register_evaluator<account_update_evaluator>();
         register_evaluator<credit_withdraw_evaluator>();
      }

      operation_result database::push_operation(const operation &op) {
         try {
            const auto &eval = _operation_evaluators[op.which()];
            FC_ASSERT(eval, "No registered evaluator for this operation ${op}", ("op", op.which()));

            _pending_events.clear();

            operation_result result;
            {
               auto session = _undo_db.start_undo_session();
               result = eval->evaluate(*this, op);
               modify(get_global_properties(), [](global_property_object &gpo) {
                  ++gpo.operation_count;
               });
               session.commit();
            }

            _applied_events = std::move(_pending_events);
            _pending_events.clear();

            operation_history_object record;
            record.sequence = get_global_properties().operation_count;
            record.timestamp = head_block_time();
            record.op = op;
            record.result = result;
            record.events = _applied_events;

            // Subscribers observe committed state and may not fail the operation
            try {
               applied_operation(record);
            } FC_CAPTURE_AND_LOG((record.sequence))

            return result;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void database::push_event(const market_event &e) {
         _pending_events.push_back(e);
      }

      const global_property_object &database::get_global_properties() const {
         return get<global_property_object>(global_property_id_type(1));
      }

      time_point_sec database::head_block_time() const {
         return get_global_properties().time;
      }

      void database::set_head_time(time_point_sec t) {
         modify(get_global_properties(), [&t](global_property_object &gpo) {
            gpo.time = t;
         });
      }

      void database::advance_time(uint32_t seconds) {
         set_head_time(head_block_time() + seconds);
      }

   }
} // curio::chain
