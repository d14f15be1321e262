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

#include <curio/protocol/base.hpp>

namespace curio {
   namespace protocol {
      struct listing_create_operation : public base_operation {
         /// Owner of the item offering it for sale
         account_name_type seller;

         /// Item to list
         nft_id_type token;

         /// Fixed sale price.  It may not be less than the mint price of the item.
         share_type price;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_name_type caller() const { return seller; }
      };

      struct listing_cancel_operation : public base_operation {
         /// Seller of the active listing
         account_name_type seller;

         /// Listed item
         nft_id_type token;

         void validate() const;

         account_name_type caller() const { return seller; }
      };

      struct nft_buy_operation : public base_operation {
         /// Account purchasing the listed item
         account_name_type buyer;

         /// Listed item
         nft_id_type token;

         /// Funds offered for the item.  Any amount above the listing price is refunded.
         share_type payment;

         void validate() const;

         account_name_type caller() const { return buyer; }
      };

      struct auction_create_operation : public base_operation {
         /// Owner of the item putting it up for auction
         account_name_type creator;

         /// Item to auction
         nft_id_type token;

         /// Opening highest bid.  The first accepted bid must exceed it.
         share_type starting_bid;

         /// Length of the bidding window in seconds
         uint32_t duration_seconds = 0;

         void validate() const;

         account_name_type caller() const { return creator; }
      };

      struct auction_bid_operation : public base_operation {
         /// Account placing the bid
         account_name_type bidder;

         /// Auctioned item
         nft_id_type token;

         /// Bid amount, escrowed until the bidder is outbid or the auction is finalized
         share_type amount;

         void validate() const;

         account_name_type caller() const { return bidder; }
      };

      struct auction_finalize_operation : public base_operation {
         /// Account closing the auction.  Eligibility depends on the configured finalize policy.
         account_name_type finalizer;

         /// Auctioned item
         nft_id_type token;

         void validate() const;

         account_name_type caller() const { return finalizer; }
      };

   }
}

FC_REFLECT( curio::protocol::listing_create_operation, (seller)(token)(price) )
FC_REFLECT( curio::protocol::listing_cancel_operation, (seller)(token) )
FC_REFLECT( curio::protocol::nft_buy_operation, (buyer)(token)(payment) )
FC_REFLECT( curio::protocol::auction_create_operation, (creator)(token)(starting_bid)(duration_seconds) )
FC_REFLECT( curio::protocol::auction_bid_operation, (bidder)(token)(amount) )
FC_REFLECT( curio::protocol::auction_finalize_operation, (finalizer)(token) )
