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
#include <curio/protocol/market.hpp>

namespace curio {
   namespace protocol {
      void listing_create_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(seller), invalid_input_exception,
                      "Invalid seller account name", ("seller", seller));
         CURIO_ASSERT(price > 0, invalid_input_exception, "Price must be greater than 0", ("price", price));
         CURIO_ASSERT(price <= CURIO_MAX_SHARE_SUPPLY, invalid_input_exception,
                      "Price exceeds the maximum share supply", ("price", price));
      }

      void listing_cancel_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(seller), invalid_input_exception,
                      "Invalid seller account name", ("seller", seller));
      }

      void nft_buy_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(buyer), invalid_input_exception,
                      "Invalid buyer account name", ("buyer", buyer));
         CURIO_ASSERT(payment > 0, invalid_input_exception, "Payment must be greater than 0", ("payment", payment));
      }

      void auction_create_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(creator), invalid_input_exception,
                      "Invalid creator account name", ("creator", creator));
         CURIO_ASSERT(starting_bid > 0, invalid_input_exception,
                      "Starting bid must be greater than 0", ("starting_bid", starting_bid));
         CURIO_ASSERT(starting_bid <= CURIO_MAX_SHARE_SUPPLY, invalid_input_exception,
                      "Starting bid exceeds the maximum share supply", ("starting_bid", starting_bid));
         CURIO_ASSERT(duration_seconds > 0, invalid_input_exception,
                      "Duration must be greater than 0", ("duration_seconds", duration_seconds));
      }

      void auction_bid_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(bidder), invalid_input_exception,
                      "Invalid bidder account name", ("bidder", bidder));
         CURIO_ASSERT(amount > 0, invalid_input_exception, "Bid must be greater than 0", ("amount", amount));
      }

      void auction_finalize_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(finalizer), invalid_input_exception,
                      "Invalid finalizer account name", ("finalizer", finalizer));
      }
   }
}
