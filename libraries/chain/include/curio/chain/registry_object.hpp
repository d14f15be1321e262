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

/**
 * @defgroup registry Collection and item objects
 */

namespace curio {
   namespace chain {
      class database;

      using namespace curio::db;

      /**
       *  @brief Tracks a named Collection into which items are minted
       *  @ingroup object
       *  @ingroup registry
       *
       *  Collections are immutable once created and are never removed.
       */
      class collection_object {
      public:
         static constexpr uint8_t type_id = collection_object_type;
         typedef collection_id_type id_type;

         collection_id_type id;

         /// Name of the collection.  Unique across the registry and case-sensitive.
         string name;

         /// Account that created the collection
         account_name_type creator;
      };

      struct by_collection_name;
      struct by_collection_creator;
      typedef multi_index_container<
         collection_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< collection_object, collection_id_type, &collection_object::id > >,
            ordered_unique< tag<by_collection_name>, member<collection_object, string, &collection_object::name> >,
            ordered_unique< tag<by_collection_creator>,
               composite_key<collection_object,
                  member<collection_object, account_name_type, &collection_object::creator>,
                  member<collection_object, collection_id_type, &collection_object::id>
               >
            >
         >
      > collection_multi_index_type;
      typedef generic_index<collection_object, collection_multi_index_type> collection_index;


      /**
       *  @brief Tracks a minted item
       *  @ingroup object
       *  @ingroup registry
       *
       *  The registry is the only authority on the owner of an item.
       *  Items are never removed.
       */
      class nft_object {
      public:
         static constexpr uint8_t type_id = nft_object_type;
         typedef nft_id_type id_type;

         nft_id_type id;

         /// Collection the item was minted into
         collection_id_type collection;

         /// Name of the item
         string name;

         /// Mint price.  Immutable and the floor for all future sale prices.
         share_type mint_price;

         /// Current owner
         account_name_type owner;

         /// Position of the item in its owner's holdings.
         /// Assigned from a ledger-wide counter whenever the item changes hands.
         uint64_t acquired_seq = 0;
      };

      struct by_nft_owner;
      struct by_nft_collection;
      typedef multi_index_container<
         nft_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< nft_object, nft_id_type, &nft_object::id > >,
            ordered_unique< tag<by_nft_owner>,
               composite_key<nft_object,
                  member<nft_object, account_name_type, &nft_object::owner>,
                  member<nft_object, uint64_t, &nft_object::acquired_seq>
               >
            >,
            ordered_unique< tag<by_nft_collection>,
               composite_key<nft_object,
                  member<nft_object, collection_id_type, &nft_object::collection>,
                  member<nft_object, nft_id_type, &nft_object::id>
               >
            >
         >
      > nft_multi_index_type;
      typedef generic_index<nft_object, nft_multi_index_type> nft_index;
   }
} // curio::chain

FC_REFLECT( curio::chain::collection_object,
            (id)
            (name)
            (creator)
          )

FC_REFLECT( curio::chain::nft_object,
            (id)
            (collection)
            (name)
            (mint_price)
            (owner)
            (acquired_seq)
          )
