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

namespace curio {
   namespace chain {

      vector<collection_object> database::get_creator_collections(const account_name_type &creator) const {
         vector<collection_object> result;
         const auto &idx = get_index_type<collection_index>().indices().get<by_collection_creator>();
         auto itr = idx.lower_bound(boost::make_tuple(creator));
         auto end = idx.upper_bound(boost::make_tuple(creator));
         for (; itr != end; ++itr)
            result.push_back(*itr);
         return result;
      }

      vector<nft_object> database::get_nfts_by_owner(const account_name_type &owner) const {
         vector<nft_object> result;
         const auto &idx = get_index_type<nft_index>().indices().get<by_nft_owner>();
         auto itr = idx.lower_bound(boost::make_tuple(owner));
         auto end = idx.upper_bound(boost::make_tuple(owner));
         for (; itr != end; ++itr)
            result.push_back(*itr);
         return result;
      }

      vector<nft_object> database::get_nfts_by_collection(collection_id_type collection) const {
         vector<nft_object> result;
         const auto &idx = get_index_type<nft_index>().indices().get<by_nft_collection>();
         auto itr = idx.lower_bound(boost::make_tuple(collection));
         auto end = idx.upper_bound(boost::make_tuple(collection));
         for (; itr != end; ++itr)
            result.push_back(*itr);
         return result;
      }

      bool database::token_exists(nft_id_type token) const {
         return find_nft(token) != nullptr;
      }

      bool database::verify_nft_ownership(nft_id_type token, const account_name_type &account) const {
         const nft_object *nft = find_nft(token);
         return nft != nullptr && nft->owner == account;
      }

      const listing_object *database::find_listing(nft_id_type token) const {
         const auto &idx = get_index_type<listing_index>().indices().get<by_listing_token>();
         auto itr = idx.find(token);
         if (itr == idx.end())
            return nullptr;
         return &*itr;
      }

      listing_object database::get_listing(nft_id_type token) const {
         const listing_object *listing = find_listing(token);
         if (listing != nullptr)
            return *listing;

         listing_object cleared;
         cleared.token = token;
         return cleared;
      }

      bool database::is_listed(nft_id_type token) const {
         const listing_object *listing = find_listing(token);
         return listing != nullptr && listing->is_active;
      }

      const auction_object *database::find_auction(nft_id_type token) const {
         const auto &idx = get_index_type<auction_index>().indices().get<by_auction_token>();
         auto itr = idx.find(token);
         if (itr == idx.end())
            return nullptr;
         return &*itr;
      }

      auction_object database::get_auction(nft_id_type token) const {
         const auction_object *auction = find_auction(token);
         if (auction != nullptr)
            return *auction;

         auction_object inactive;
         inactive.token = token;
         return inactive;
      }

      bool database::is_auctioned(nft_id_type token) const {
         const auction_object *auction = find_auction(token);
         return auction != nullptr && auction->active;
      }

      auction_status database::check_auction_status(nft_id_type token) const {
         auction_status status;
         const auction_object *auction = find_auction(token);
         if (auction != nullptr) {
            status.active = auction->active;
            status.highest_bid = auction->highest_bid;
            status.highest_bidder = auction->highest_bidder;
         }
         return status;
      }

   }
} // curio::chain
