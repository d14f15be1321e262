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

#include <curio/protocol/types.hpp>

namespace curio {
   namespace protocol {

      struct collection_created_event {
         collection_id_type collection_id;
      };

      struct nft_minted_event {
         nft_id_type token_id;
      };

      struct nft_transferred_event {
         nft_id_type token_id;
         account_name_type to;
      };

      struct nft_listed_event {
         nft_id_type token_id;
         share_type price;
         account_name_type seller;
      };

      struct nft_listing_deleted_event {
         nft_id_type token_id;
      };

      struct nft_sold_event {
         nft_id_type token_id;
         share_type price;
         account_name_type buyer;
      };

      struct auction_created_event {
         nft_id_type token_id;
         share_type starting_bid;
         account_name_type creator;
      };

      struct bid_placed_event {
         nft_id_type token_id;
         share_type amount;
         account_name_type bidder;
      };

      /// Auction closed without a sale; the item stays with its creator
      struct auction_cancelled_event {
         nft_id_type token_id;
         account_name_type creator;
      };

      /// A payout could not be delivered and is held as a pending credit
      struct payment_deferred_event {
         account_name_type account;
         share_type amount;
      };

      typedef fc::static_variant<
         collection_created_event,
         nft_minted_event,
         nft_transferred_event,
         nft_listed_event,
         nft_listing_deleted_event,
         nft_sold_event,
         auction_created_event,
         bid_placed_event,
         auction_cancelled_event,
         payment_deferred_event
      > market_event;

      /**
       * @brief Item referenced by an event, if any
       * @param e Event
       * @return Token ID or a null ID for events that are not about a single item
       */
      nft_id_type event_token(const market_event &e);

   }
} // curio::protocol

FC_REFLECT( curio::protocol::collection_created_event, (collection_id) )
FC_REFLECT( curio::protocol::nft_minted_event, (token_id) )
FC_REFLECT( curio::protocol::nft_transferred_event, (token_id)(to) )
FC_REFLECT( curio::protocol::nft_listed_event, (token_id)(price)(seller) )
FC_REFLECT( curio::protocol::nft_listing_deleted_event, (token_id) )
FC_REFLECT( curio::protocol::nft_sold_event, (token_id)(price)(buyer) )
FC_REFLECT( curio::protocol::auction_created_event, (token_id)(starting_bid)(creator) )
FC_REFLECT( curio::protocol::bid_placed_event, (token_id)(amount)(bidder) )
FC_REFLECT( curio::protocol::auction_cancelled_event, (token_id)(creator) )
FC_REFLECT( curio::protocol::payment_deferred_event, (account)(amount) )

FC_REFLECT_TYPENAME( curio::protocol::market_event )
