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
#include <curio/chain/types.hpp>
#include <curio/db/generic_index.hpp>

namespace curio {
   namespace chain {

      using namespace curio::db;

      /**
       * @brief Maintains ledger-wide counters and totals
       * @ingroup object
       *
       * Exactly one instance exists.  It is updated by every operation that moves
       * funds into or out of the marketplace or changes the owner of an item.
       */
      class global_property_object {
      public:
         static constexpr uint8_t type_id = global_property_object_type;
         typedef global_property_id_type id_type;

         global_property_id_type id;

         /// Current ledger time
         time_point_sec time;

         /// Number of operations committed so far
         uint64_t operation_count = 0;

         /// Next value of nft_object::acquired_seq
         uint64_t next_acquired_seq = 1;

         /// Bids currently escrowed by the marketplace
         share_type escrow_balance;

         /// Sum of all pending credits
         share_type pending_credit_balance;
      };

      typedef multi_index_container<
         global_property_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< global_property_object, global_property_id_type, &global_property_object::id > >
         >
      > global_property_multi_index_type;
      typedef generic_index<global_property_object, global_property_multi_index_type> global_property_index;

   }
} // curio::chain

FC_REFLECT( curio::chain::global_property_object,
            (id)
            (time)
            (operation_count)
            (next_acquired_seq)
            (escrow_balance)
            (pending_credit_balance)
          )
