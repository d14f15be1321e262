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

#include <boost/program_options.hpp>

namespace curio {
   namespace chain {

      /// Accounts permitted to finalize an auction once it has ended
      enum auction_finalize_policy {
         finalize_by_anyone,
         finalize_by_creator,
         finalize_by_participants ///< Creator or highest bidder
      };

      /**
       * @brief Tunable rules of the marketplace
       *
       * Parameters are fixed for the lifetime of a database.
       */
      struct chain_parameters {
         auction_finalize_policy finalize_policy = finalize_by_anyone;

         /// Minimum raise over the current highest bid, in hundredths of a percent
         uint16_t min_bid_increment_centipercent = CURIO_DEFAULT_MIN_BID_INCREMENT;

         void validate() const;

         /**
          * @brief Register the options understood by from_options()
          * @param cfg Options description to extend
          */
         static void set_program_options(boost::program_options::options_description &cfg);

         /**
          * @brief Build parameters from parsed options
          * @param options Parsed options, possibly without any of ours
          * @return Parameters with defaults for every absent option
          */
         static chain_parameters from_options(const boost::program_options::variables_map &options);
      };

      /**
       * @brief Parse the textual name of a finalize policy
       * @param name One of "anyone", "creator" or "participants"
       * @return Policy
       */
      auction_finalize_policy parse_finalize_policy(const string &name);

      string to_string(auction_finalize_policy policy);

   }
} // curio::chain

FC_REFLECT_ENUM( curio::chain::auction_finalize_policy,
                 (finalize_by_anyone)
                 (finalize_by_creator)
                 (finalize_by_participants)
               )

FC_REFLECT( curio::chain::chain_parameters, (finalize_policy)(min_bid_increment_centipercent) )
