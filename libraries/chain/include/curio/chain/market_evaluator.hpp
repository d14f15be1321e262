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

#include <curio/chain/evaluator.hpp>
#include <curio/chain/market_object.hpp>
#include <curio/chain/registry_object.hpp>
#include <curio/protocol/market.hpp>

namespace curio {
   namespace chain {

      class listing_create_evaluator : public evaluator<listing_create_evaluator> {
      public:
         typedef listing_create_operation operation_type;

         void_result do_evaluate(const listing_create_operation &o);

         void_result do_apply(const listing_create_operation &o);

         const listing_object *_listing = nullptr;
      };

      class listing_cancel_evaluator : public evaluator<listing_cancel_evaluator> {
      public:
         typedef listing_cancel_operation operation_type;

         void_result do_evaluate(const listing_cancel_operation &o);

         void_result do_apply(const listing_cancel_operation &o);

         const listing_object *_listing = nullptr;
      };

      class nft_buy_evaluator : public evaluator<nft_buy_evaluator> {
      public:
         typedef nft_buy_operation operation_type;

         void_result do_evaluate(const nft_buy_operation &o);

         /// @return Overpayment refunded to the buyer
         share_type do_apply(const nft_buy_operation &o);

         const listing_object *_listing = nullptr;
         const nft_object *ptr_token_obj = nullptr;
      };

      class auction_create_evaluator : public evaluator<auction_create_evaluator> {
      public:
         typedef auction_create_operation operation_type;

         void_result do_evaluate(const auction_create_operation &o);

         void_result do_apply(const auction_create_operation &o);

         const auction_object *_auction = nullptr;
      };

      class auction_bid_evaluator : public evaluator<auction_bid_evaluator> {
      public:
         typedef auction_bid_operation operation_type;

         void_result do_evaluate(const auction_bid_operation &o);

         void_result do_apply(const auction_bid_operation &o);

         const auction_object *_auction = nullptr;
      };

      class auction_finalize_evaluator : public evaluator<auction_finalize_evaluator> {
      public:
         typedef auction_finalize_operation operation_type;

         void_result do_evaluate(const auction_finalize_operation &o);

         void_result do_apply(const auction_finalize_operation &o);

         const auction_object *_auction = nullptr;
      };

      /**
       * Calculate a percentage of a value, rounding any fraction up
       * @param value Value, which must be non-negative
       * @param percent Percentage in hundredths of a percent
       * @return Percentage of the value
       */
      share_type calculate_percent_and_round_up(const share_type &value, uint16_t percent);

      /**
       * Determine the smallest bid that an auction accepts next
       * @param highest_bid Current highest bid (or starting bid)
       * @param increment_centipercent Configured minimum raise in hundredths of a percent
       * @return Minimum acceptable bid
       */
      share_type minimum_next_bid(const share_type &highest_bid, uint16_t increment_centipercent);

   } // namespace chain
} // namespace curio
