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
#include <curio/chain/chain_parameters.hpp>

namespace curio {
   namespace chain {
      namespace bpo = boost::program_options;

      void chain_parameters::validate() const {
         CURIO_ASSERT(min_bid_increment_centipercent <= CURIO_100_PERCENT, invalid_input_exception,
                      "Minimum bid increment should not exceed CURIO_100_PERCENT",
                      ("min_bid_increment_centipercent", min_bid_increment_centipercent));
      }

      void chain_parameters::set_program_options(bpo::options_description &cfg) {
         cfg.add_options()
               ("auction-finalize-policy", bpo::value<string>()->default_value(CURIO_DEFAULT_FINALIZE_POLICY),
                "Who may finalize an ended auction: anyone, creator or participants")
               ("min-bid-increment-centipercent",
                bpo::value<uint16_t>()->default_value(CURIO_DEFAULT_MIN_BID_INCREMENT),
                "Minimum raise over the highest bid in hundredths of a percent (0 accepts any higher bid)")
               ;
      }

      chain_parameters chain_parameters::from_options(const bpo::variables_map &options) {
         chain_parameters params;
         if (options.count("auction-finalize-policy"))
            params.finalize_policy = parse_finalize_policy(options["auction-finalize-policy"].as<string>());
         if (options.count("min-bid-increment-centipercent"))
            params.min_bid_increment_centipercent = options["min-bid-increment-centipercent"].as<uint16_t>();
         params.validate();
         return params;
      }

      auction_finalize_policy parse_finalize_policy(const string &name) {
         if (name == "anyone")
            return finalize_by_anyone;
         if (name == "creator")
            return finalize_by_creator;
         if (name == "participants")
            return finalize_by_participants;
         FC_THROW_EXCEPTION(invalid_input_exception, "Unknown auction finalize policy ${name}", ("name", name));
      }

      string to_string(auction_finalize_policy policy) {
         switch (policy) {
            case finalize_by_anyone:
               return "anyone";
            case finalize_by_creator:
               return "creator";
            case finalize_by_participants:
               return "participants";
         }
         FC_THROW_EXCEPTION(invalid_input_exception, "Unknown auction finalize policy ${p}", ("p", int(policy)));
      }
   }
}
