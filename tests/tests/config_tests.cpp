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
#include <boost/test/unit_test.hpp>

#include <curio/app/ledger_api.hpp>
#include <curio/chain/chain_parameters.hpp>
#include <curio/market_history/market_history.hpp>

#include "../common/database_fixture.hpp"

using namespace curio::chain;
namespace bpo = boost::program_options;

namespace {
   bpo::variables_map parse(const bpo::options_description& desc, std::vector<std::string> args) {
      std::vector<const char*> argv;
      argv.push_back("curio");
      for (const std::string& a : args)
         argv.push_back(a.c_str());

      bpo::variables_map options;
      bpo::store(bpo::parse_command_line(static_cast<int>(argv.size()), argv.data(), desc), options);
      bpo::notify(options);
      return options;
   }
}

BOOST_AUTO_TEST_SUITE( config_tests )

/**
 * Defaults apply when no option is given
 */
BOOST_AUTO_TEST_CASE( chain_parameters_defaults ) {
   try {
      bpo::options_description desc;
      chain_parameters::set_program_options(desc);

      const chain_parameters params = chain_parameters::from_options(parse(desc, {}));
      BOOST_CHECK(params.finalize_policy == finalize_by_anyone);
      BOOST_CHECK_EQUAL(params.min_bid_increment_centipercent, 0);

      const chain_parameters unparsed = chain_parameters::from_options(bpo::variables_map());
      BOOST_CHECK(unparsed.finalize_policy == finalize_by_anyone);
   } FC_LOG_AND_RETHROW()
}

/**
 * Every finalize policy and the bid increment are read from the options
 */
BOOST_AUTO_TEST_CASE( chain_parameters_parsing ) {
   try {
      bpo::options_description desc;
      chain_parameters::set_program_options(desc);

      chain_parameters params = chain_parameters::from_options(
         parse(desc, {"--auction-finalize-policy=creator", "--min-bid-increment-centipercent=250"}));
      BOOST_CHECK(params.finalize_policy == finalize_by_creator);
      BOOST_CHECK_EQUAL(params.min_bid_increment_centipercent, 250);

      params = chain_parameters::from_options(parse(desc, {"--auction-finalize-policy=participants"}));
      BOOST_CHECK(params.finalize_policy == finalize_by_participants);
      BOOST_CHECK_EQUAL(to_string(params.finalize_policy), "participants");

      BOOST_TEST_MESSAGE("Rejecting unknown policies and oversized increments");
      REQUIRE_EXCEPTION_WITH_TEXT(chain_parameters::from_options(parse(desc, {"--auction-finalize-policy=nobody"})),
                                  "Unknown auction finalize policy");
      CURIO_REQUIRE_THROW(parse_finalize_policy("Creator"), invalid_input_exception);
      CURIO_REQUIRE_THROW(chain_parameters::from_options(parse(desc, {"--min-bid-increment-centipercent=10001"})),
                          invalid_input_exception);
   } FC_LOG_AND_RETHROW()
}

/**
 * The ledger collects the options of its plugins and applies them at initialization
 */
BOOST_AUTO_TEST_CASE( ledger_options ) {
   try {
      curio::app::ledger_api app;
      auto history = app.register_plugin<curio::market_history::market_history>();

      bpo::options_description cli;
      bpo::options_description cfg;
      app.set_program_options(cli, cfg);
      BOOST_CHECK(cfg.find_nothrow("auction-finalize-policy", false) != nullptr);
      BOOST_CHECK(cfg.find_nothrow("market-history-max-events-per-token", false) != nullptr);

      app.initialize(parse(cfg, {"--auction-finalize-policy=creator", "--market-history-max-events-per-token=1"}));
      app.startup();
      BOOST_CHECK(app.chain_database()->get_chain_parameters().finalize_policy == finalize_by_creator);

      ACTORS((alice)(bob));
      const collection_id_type art_id = app.create_collection(alice_id, "Art");
      const nft_id_type token = app.mint_nft(alice_id, art_id, "Portrait", 100);
      app.create_auction(alice_id, token, 100, 10);
      app.advance_time(10);
      REQUIRE_EXCEPTION_WITH_TEXT(app.finalize_auction(bob_id, token), "Not authorized to finalize auction");
      app.finalize_auction(alice_id, token);

      BOOST_CHECK_EQUAL(history->get_events_by_token(token).size(), 1u);

      BOOST_TEST_MESSAGE("A ledger may be initialized only once");
      CURIO_REQUIRE_THROW(app.initialize(bpo::variables_map()), fc::exception);

      app.shutdown();
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
