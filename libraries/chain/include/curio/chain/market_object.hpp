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
       *  @brief Fixed-price sale offer for an item
       *  @ingroup object
       *
       *  At most one record exists per item.  A cancelled or completed listing is
       *  reset to its defaults rather than removed.
       */
      class listing_object {
      public:
         static constexpr uint8_t type_id = listing_object_type;
         typedef listing_id_type id_type;

         listing_id_type id;

         nft_id_type token;

         share_type price;

         account_name_type seller;

         bool is_active = false;
      };

      struct by_listing_token;
      typedef multi_index_container<
         listing_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< listing_object, listing_id_type, &listing_object::id > >,
            ordered_unique< tag<by_listing_token>, member<listing_object, nft_id_type, &listing_object::token> >
         >
      > listing_multi_index_type;
      typedef generic_index<listing_object, listing_multi_index_type> listing_index;


      /**
       *  @brief Timed ascending-bid sale of an item
       *  @ingroup object
       *
       *  At most one record exists per item.  The highest bid, if any bidder exists,
       *  is held in escrow by the marketplace until the bidder is outbid or the
       *  auction is finalized.
       */
      class auction_object {
      public:
         static constexpr uint8_t type_id = auction_object_type;
         typedef auction_id_type id_type;

         auction_id_type id;

         nft_id_type token;

         /// Owner of the item when the auction was created; receives the winning bid
         account_name_type creator;

         /// Starting bid until the first bid is accepted
         share_type highest_bid;

         optional<account_name_type> highest_bidder;

         /// Bids are accepted strictly before this time; finalization is permitted from it onward
         time_point_sec end_time;

         bool active = false;
      };

      struct by_auction_token;
      typedef multi_index_container<
         auction_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< auction_object, auction_id_type, &auction_object::id > >,
            ordered_unique< tag<by_auction_token>, member<auction_object, nft_id_type, &auction_object::token> >
         >
      > auction_multi_index_type;
      typedef generic_index<auction_object, auction_multi_index_type> auction_index;

      /// Summary returned by database::check_auction_status()
      struct auction_status {
         bool active = false;
         share_type highest_bid;
         optional<account_name_type> highest_bidder;
      };

   }
} // curio::chain

FC_REFLECT( curio::chain::listing_object,
            (id)
            (token)
            (price)
            (seller)
            (is_active)
          )

FC_REFLECT( curio::chain::auction_object,
            (id)
            (token)
            (creator)
            (highest_bid)
            (highest_bidder)
            (end_time)
            (active)
          )

FC_REFLECT( curio::chain::auction_status, (active)(highest_bid)(highest_bidder) )
