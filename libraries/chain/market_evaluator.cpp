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
#include <curio/chain/market_evaluator.hpp>

#include <fc/uint128.hpp>

namespace curio {
   namespace chain {

      share_type calculate_percent_and_round_up(const share_type &value, uint16_t percent) {
         if (value == 0 || percent == 0) {
            return share_type(0);
         }
         FC_ASSERT(0 <= value);
         FC_ASSERT(percent <= CURIO_100_PERCENT);

         const fc::uint128_t A = fc::uint128_t(value.value) * percent;
         const uint32_t B(CURIO_100_PERCENT);
         const fc::uint128_t C = ((A - 1) / B) + 1;

         FC_ASSERT(C <= CURIO_MAX_SHARE_SUPPLY, "Overflow when calculating percent");

         return static_cast<int64_t>(C);
      }

      share_type minimum_next_bid(const share_type &highest_bid, uint16_t increment_centipercent) {
         share_type increment = calculate_percent_and_round_up(highest_bid, increment_centipercent);
         // Any bid must be strictly higher than the current one
         if (increment < 1)
            increment = 1;
         return highest_bid + increment;
      }

      void_result listing_create_evaluator::do_evaluate(const listing_create_operation &op) {
         try {
            const database &d = db();

            const nft_object &token = d.get_nft(op.token);

            // An item is either unlisted, listed or in an auction
            CURIO_ASSERT(!d.is_listed(op.token), conflict_exception,
                         "NFT already listed for sale", ("token", op.token));
            CURIO_ASSERT(!d.is_auctioned(op.token), conflict_exception,
                         "NFT is already in an active auction", ("token", op.token));

            CURIO_ASSERT(token.owner == op.seller, unauthorized_exception,
                         "Not token owner", ("owner", token.owner)("seller", op.seller));

            CURIO_ASSERT(op.price >= token.mint_price, invalid_input_exception,
                         "Price cannot be less than mint price",
                         ("price", op.price)("mint_price", token.mint_price));

            _listing = d.find_listing(op.token);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result listing_create_evaluator::do_apply(const listing_create_operation &op) {
         try {
            database &d = db();

            auto fill = [&op](listing_object &l) {
               l.token = op.token;
               l.price = op.price;
               l.seller = op.seller;
               l.is_active = true;
            };
            if (_listing == nullptr)
               d.create<listing_object>(fill);
            else
               d.modify(*_listing, fill);

            d.push_event(nft_listed_event{op.token, op.price, op.seller});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result listing_cancel_evaluator::do_evaluate(const listing_cancel_operation &op) {
         try {
            const database &d = db();

            const listing_object *listing = d.find_listing(op.token);
            CURIO_ASSERT(listing != nullptr && listing->is_active, invalid_state_exception,
                         "NFT not listed for sale", ("token", op.token));
            CURIO_ASSERT(listing->seller == op.seller, unauthorized_exception,
                         "Not the seller", ("seller", listing->seller)("caller", op.seller));
            _listing = listing;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result listing_cancel_evaluator::do_apply(const listing_cancel_operation &op) {
         try {
            database &d = db();

            d.modify(*_listing, [](listing_object &l) {
               l.price = 0;
               l.seller = account_name_type();
               l.is_active = false;
            });
            d.push_event(nft_listing_deleted_event{op.token});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result nft_buy_evaluator::do_evaluate(const nft_buy_operation &op) {
         try {
            const database &d = db();

            const listing_object *listing = d.find_listing(op.token);
            CURIO_ASSERT(listing != nullptr && listing->is_active, invalid_state_exception,
                         "NFT not listed for sale", ("token", op.token));
            CURIO_ASSERT(op.payment >= listing->price, invalid_input_exception,
                         "Insufficient payment", ("payment", op.payment)("price", listing->price));
            CURIO_ASSERT(d.get_balance(op.buyer) >= op.payment, invalid_input_exception,
                         "Insufficient balance",
                         ("buyer", op.buyer)("balance", d.get_balance(op.buyer))("payment", op.payment));

            // The registry remains the authority on ownership while the item is listed
            const nft_object &token = d.get_nft(op.token);
            CURIO_ASSERT(token.owner == listing->seller, invalid_state_exception,
                         "Seller no longer owns the NFT", ("owner", token.owner)("seller", listing->seller));

            _listing = listing;
            ptr_token_obj = &token;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      share_type nft_buy_evaluator::do_apply(const nft_buy_operation &op) {
         try {
            database &d = db();

            const account_name_type seller = _listing->seller;
            const share_type price = _listing->price;

            d.escrow_deposit(op.buyer, op.payment);

            // Clear the listing before any funds leave the marketplace
            d.modify(*_listing, [](listing_object &l) {
               l.price = 0;
               l.seller = account_name_type();
               l.is_active = false;
            });

            d.transfer_nft(*ptr_token_obj, op.buyer);
            FC_ASSERT(d.verify_nft_ownership(op.token, op.buyer),
                      "Ownership of ${token} was not transferred to ${buyer}",
                      ("token", op.token)("buyer", op.buyer));

            d.push_event(nft_sold_event{op.token, price, op.buyer});

            d.escrow_release(seller, price);
            const share_type refund = op.payment - price;
            d.escrow_release(op.buyer, refund);

            return refund;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_create_evaluator::do_evaluate(const auction_create_operation &op) {
         try {
            const database &d = db();

            const nft_object &token = d.get_nft(op.token);

            CURIO_ASSERT(!d.is_listed(op.token), conflict_exception,
                         "NFT already listed for sale", ("token", op.token));
            CURIO_ASSERT(!d.is_auctioned(op.token), conflict_exception,
                         "NFT is already in an active auction", ("token", op.token));

            CURIO_ASSERT(token.owner == op.creator, unauthorized_exception,
                         "Not token owner", ("owner", token.owner)("creator", op.creator));

            CURIO_ASSERT(op.starting_bid >= token.mint_price, invalid_input_exception,
                         "Starting bid cannot be less than mint price",
                         ("starting_bid", op.starting_bid)("mint_price", token.mint_price));

            _auction = d.find_auction(op.token);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_create_evaluator::do_apply(const auction_create_operation &op) {
         try {
            database &d = db();

            const time_point_sec end_time = d.head_block_time() + op.duration_seconds;
            auto fill = [&op, &end_time](auction_object &a) {
               a.token = op.token;
               a.creator = op.creator;
               a.highest_bid = op.starting_bid;
               a.highest_bidder.reset();
               a.end_time = end_time;
               a.active = true;
            };
            if (_auction == nullptr)
               d.create<auction_object>(fill);
            else
               d.modify(*_auction, fill);

            d.push_event(auction_created_event{op.token, op.starting_bid, op.creator});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_bid_evaluator::do_evaluate(const auction_bid_operation &op) {
         try {
            const database &d = db();

            const auction_object *auction = d.find_auction(op.token);
            CURIO_ASSERT(auction != nullptr && auction->active, invalid_state_exception,
                         "No active auction", ("token", op.token));
            CURIO_ASSERT(d.head_block_time() < auction->end_time, invalid_state_exception,
                         "Auction ended", ("now", d.head_block_time())("end_time", auction->end_time));

            const share_type min_bid = minimum_next_bid(auction->highest_bid,
                                                        d.get_chain_parameters().min_bid_increment_centipercent);
            CURIO_ASSERT(op.amount >= min_bid, invalid_input_exception,
                         "Bid too low", ("amount", op.amount)("minimum", min_bid));
            CURIO_ASSERT(d.get_balance(op.bidder) >= op.amount, invalid_input_exception,
                         "Insufficient balance",
                         ("bidder", op.bidder)("balance", d.get_balance(op.bidder))("amount", op.amount));

            CURIO_ASSERT(d.verify_nft_ownership(op.token, auction->creator), invalid_state_exception,
                         "Auction creator no longer owns the NFT", ("creator", auction->creator));

            _auction = auction;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_bid_evaluator::do_apply(const auction_bid_operation &op) {
         try {
            database &d = db();

            const optional<account_name_type> previous_bidder = _auction->highest_bidder;
            const share_type previous_bid = _auction->highest_bid;

            d.escrow_deposit(op.bidder, op.amount);
            d.modify(*_auction, [&op](auction_object &a) {
               a.highest_bid = op.amount;
               a.highest_bidder = op.bidder;
            });
            d.push_event(bid_placed_event{op.token, op.amount, op.bidder});

            // Refund the outbid bidder last.  A refused refund becomes a pending credit.
            if (previous_bidder.valid())
               d.escrow_release(*previous_bidder, previous_bid);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_finalize_evaluator::do_evaluate(const auction_finalize_operation &op) {
         try {
            const database &d = db();

            const auction_object *auction = d.find_auction(op.token);
            CURIO_ASSERT(auction != nullptr && auction->active, invalid_state_exception,
                         "No active auction", ("token", op.token));
            CURIO_ASSERT(d.head_block_time() >= auction->end_time, invalid_state_exception,
                         "Auction still active", ("now", d.head_block_time())("end_time", auction->end_time));

            bool authorized = true;
            switch (d.get_chain_parameters().finalize_policy) {
               case finalize_by_anyone:
                  break;
               case finalize_by_creator:
                  authorized = (op.finalizer == auction->creator);
                  break;
               case finalize_by_participants:
                  authorized = (op.finalizer == auction->creator) ||
                               (auction->highest_bidder.valid() && *auction->highest_bidder == op.finalizer);
                  break;
            }
            CURIO_ASSERT(authorized, unauthorized_exception,
                         "Not authorized to finalize auction",
                         ("finalizer", op.finalizer)("policy", to_string(d.get_chain_parameters().finalize_policy)));

            _auction = auction;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_finalize_evaluator::do_apply(const auction_finalize_operation &op) {
         try {
            database &d = db();

            const account_name_type creator = _auction->creator;
            const share_type highest_bid = _auction->highest_bid;
            const optional<account_name_type> winner = _auction->highest_bidder;

            d.modify(*_auction, [](auction_object &a) {
               a.active = false;
            });

            if (!winner.valid()) {
               // The item never left its creator
               d.push_event(auction_cancelled_event{op.token, creator});
               return void_result();
            }

            const nft_object &token = d.get_nft(op.token);
            if (token.owner != creator) {
               wlog("Auction creator ${c} no longer owns ${t}, refunding ${b} to ${w}",
                    ("c", creator)("t", op.token)("b", highest_bid)("w", *winner));
               d.escrow_release(*winner, highest_bid);
               d.push_event(auction_cancelled_event{op.token, creator});
               return void_result();
            }

            d.transfer_nft(token, *winner);
            FC_ASSERT(d.verify_nft_ownership(op.token, *winner),
                      "Ownership of ${token} was not transferred to ${winner}",
                      ("token", op.token)("winner", *winner));

            d.push_event(nft_sold_event{op.token, highest_bid, *winner});
            d.escrow_release(creator, highest_bid);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   }
}
