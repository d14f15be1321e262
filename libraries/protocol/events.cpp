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
#include <curio/protocol/events.hpp>

namespace curio {
   namespace protocol {

      struct event_token_visitor {
         typedef nft_id_type result_type;

         /** events without a token field */
         template<typename T>
         nft_id_type operator()( const T& )const { return nft_id_type(); }

         nft_id_type operator()( const nft_minted_event& e )const { return e.token_id; }
         nft_id_type operator()( const nft_transferred_event& e )const { return e.token_id; }
         nft_id_type operator()( const nft_listed_event& e )const { return e.token_id; }
         nft_id_type operator()( const nft_listing_deleted_event& e )const { return e.token_id; }
         nft_id_type operator()( const nft_sold_event& e )const { return e.token_id; }
         nft_id_type operator()( const auction_created_event& e )const { return e.token_id; }
         nft_id_type operator()( const bid_placed_event& e )const { return e.token_id; }
         nft_id_type operator()( const auction_cancelled_event& e )const { return e.token_id; }
      };

      nft_id_type event_token(const market_event &e) {
         return e.visit( event_token_visitor() );
      }

   }
} // curio::protocol
