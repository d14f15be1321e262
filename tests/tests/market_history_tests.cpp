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
#include <curio/market_history/market_history.hpp>

#include "../common/database_fixture.hpp"

using namespace curio::chain;
using namespace curio::market_history;
namespace bpo = boost::program_options;

struct market_history_fixture {
   curio::app::ledger_api app;
   std::shared_ptr<market_history> history;

   explicit market_history_fixture(uint32_t max_events_per_token = 0) {
      history = app.register_plugin<market_history>();

      bpo::variables_map options;
      if (max_events_per_token > 0)
         options.emplace("market-history-max-events-per-token",
                         bpo::variable_value(boost::any(max_events_per_token), false));
      app.initialize(options);
      app.startup();
   }

   template<typename EventType>
   static bool is(const market_event_object& o) {
      return o.event.which() == market_event::tag<EventType>::value;
   }
};

struct pruned_history_fixture : market_history_fixture {
   pruned_history_fixture() : market_history_fixture(3) {}
};

BOOST_FIXTURE_TEST_SUITE( market_history_tests, market_history_fixture )

/**
 * Committed events are recorded in emission order and indexed by item
 */
BOOST_AUTO_TEST_CASE( events_recorded_by_token ) {
   try {
      ACTORS((alice)(bob));
      app.deposit(bob_id, 1000);

      BOOST_CHECK_EQUAL(history->plugin_name(), "market_history");
      BOOST_CHECK(app.get_plugin<market_history>("market_history") == history);

      const collection_id_type art_id = app.create_collection(alice_id, "Art");
      const nft_id_type token1 = app.mint_nft(alice_id, art_id, "One", 100);
      const nft_id_type token2 = app.mint_nft(alice_id, art_id, "Two", 100);
      app.list_nft(alice_id, token1, 300);
      app.buy_nft(bob_id, token1, 300);

      BOOST_TEST_MESSAGE("Checking the events of the sold item, newest first");
      const vector<market_event_object> events = history->get_events_by_token(token1);
      BOOST_REQUIRE_EQUAL(events.size(), 4u);
      BOOST_CHECK(is<nft_sold_event>(events[0]));
      BOOST_CHECK(is<nft_transferred_event>(events[1]));
      BOOST_CHECK(is<nft_listed_event>(events[2]));
      BOOST_CHECK(is<nft_minted_event>(events[3]));
      BOOST_CHECK(events[0].operation_sequence == events[1].operation_sequence);
      BOOST_CHECK(events[0].sequence > events[1].sequence);
      BOOST_CHECK(events[0].token == token1);

      BOOST_CHECK_EQUAL(history->get_events_by_token(token1, 2).size(), 2u);
      BOOST_CHECK_EQUAL(history->get_events_by_token(token2).size(), 1u);
      BOOST_CHECK(history->get_events_by_token(nft_id_type(99)).empty());

      BOOST_TEST_MESSAGE("Checking the most recent events across all items");
      const vector<market_event_object> recent = history->get_recent_events(3);
      BOOST_REQUIRE_EQUAL(recent.size(), 3u);
      BOOST_CHECK(is<nft_sold_event>(recent[0]));
      BOOST_CHECK(is<nft_transferred_event>(recent[1]));
      BOOST_CHECK(is<nft_listed_event>(recent[2]));

      const vector<market_event_object> all = history->get_recent_events(100);
      BOOST_REQUIRE_EQUAL(all.size(), 6u);
      BOOST_CHECK(is<collection_created_event>(all.back()));
      BOOST_CHECK(all.back().token.is_null());
      BOOST_CHECK_EQUAL(history->get_event_count(), 6u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Sales of an item are reported oldest first
 */
BOOST_AUTO_TEST_CASE( sales_by_token ) {
   try {
      ACTORS((alice)(bob)(carol));
      app.deposit(bob_id, 1000);
      app.deposit(carol_id, 1000);

      const collection_id_type art_id = app.create_collection(alice_id, "Art");
      const nft_id_type token = app.mint_nft(alice_id, art_id, "One", 100);

      app.list_nft(alice_id, token, 200);
      app.buy_nft(bob_id, token, 200);

      app.create_auction(bob_id, token, 250, 60);
      app.place_bid(carol_id, token, 400);
      app.advance_time(60);
      app.finalize_auction(carol_id, token);

      const vector<nft_sold_event> sales = history->get_sales_by_token(token);
      BOOST_REQUIRE_EQUAL(sales.size(), 2u);
      BOOST_CHECK_EQUAL(sales[0].buyer, bob_id);
      BOOST_CHECK_EQUAL(sales[0].price.value, 200);
      BOOST_CHECK_EQUAL(sales[1].buyer, carol_id);
      BOOST_CHECK_EQUAL(sales[1].price.value, 400);
   } FC_LOG_AND_RETHROW()
}

/**
 * Failed operations are not recorded
 */
BOOST_AUTO_TEST_CASE( failed_operations_not_recorded ) {
   try {
      ACTORS((alice)(bob));

      const collection_id_type art_id = app.create_collection(alice_id, "Art");
      const nft_id_type token = app.mint_nft(alice_id, art_id, "One", 100);
      const uint64_t count = history->get_event_count();

      CURIO_REQUIRE_THROW(app.list_nft(bob_id, token, 100), unauthorized_exception);
      CURIO_REQUIRE_THROW(app.create_collection(bob_id, "Art"), conflict_exception);
      BOOST_CHECK_EQUAL(history->get_event_count(), count);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE( market_history_pruning_tests, pruned_history_fixture )

/**
 * Only the newest events of each item are kept when a limit is configured
 */
BOOST_AUTO_TEST_CASE( events_pruned_per_token ) {
   try {
      ACTORS((alice));

      const collection_id_type art_id = app.create_collection(alice_id, "Art");
      const nft_id_type token1 = app.mint_nft(alice_id, art_id, "One", 100);
      const nft_id_type token2 = app.mint_nft(alice_id, art_id, "Two", 100);
      for (int i = 0; i < 3; ++i) {
         app.list_nft(alice_id, token1, 100);
         app.cancel_listing(alice_id, token1);
      }

      const vector<market_event_object> events = history->get_events_by_token(token1);
      BOOST_REQUIRE_EQUAL(events.size(), 3u);
      BOOST_CHECK(is<nft_listing_deleted_event>(events[0]));
      BOOST_CHECK(is<nft_listed_event>(events[1]));
      BOOST_CHECK(is<nft_listing_deleted_event>(events[2]));

      BOOST_CHECK_EQUAL(history->get_events_by_token(token2).size(), 1u);
      BOOST_CHECK_EQUAL(history->get_event_count(), 5u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Events not tied to an item are capped by the same limit
 */
BOOST_AUTO_TEST_CASE( itemless_events_pruned ) {
   try {
      ACTORS((alice));

      for (int i = 0; i < 5; ++i)
         app.create_collection(alice_id, "Art " + fc::to_string(int64_t(i)));

      BOOST_CHECK_EQUAL(history->get_event_count(), 3u);

      const vector<market_event_object> events = history->get_recent_events();
      BOOST_REQUIRE_EQUAL(events.size(), 3u);
      BOOST_CHECK(events[0].token.is_null());
      BOOST_CHECK(events[0].event.get<collection_created_event>().collection_id == collection_id_type(5));
      BOOST_CHECK(events[2].event.get<collection_created_event>().collection_id == collection_id_type(3));
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
