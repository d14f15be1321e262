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

#include <curio/protocol/registry.hpp>
#include <curio/protocol/market.hpp>
#include <curio/protocol/account.hpp>

namespace curio {
   namespace protocol {

      /**
       * @ingroup operations
       *
       * Defines the set of valid operations as a discriminated union type.
       */
      typedef fc::static_variant<
         /*  0 */ collection_create_operation,
         /*  1 */ nft_mint_operation,
         /*  2 */ nft_transfer_operation,
         /*  3 */ listing_create_operation,
         /*  4 */ listing_cancel_operation,
         /*  5 */ nft_buy_operation,
         /*  6 */ auction_create_operation,
         /*  7 */ auction_bid_operation,
         /*  8 */ auction_finalize_operation,
         /*  9 */ account_update_operation,
         /* 10 */ credit_withdraw_operation
      > operation;

      void operation_validate( const operation& op );

      account_name_type operation_caller( const operation& op );

   }
} // curio::protocol

FC_REFLECT_TYPENAME( curio::protocol::operation )
