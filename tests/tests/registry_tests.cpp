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

#include <curio/chain/database.hpp>
#include <curio/chain/registry_object.hpp>

#include "../common/database_fixture.hpp"

using namespace curio::chain;
using namespace curio::chain::test;

BOOST_FIXTURE_TEST_SUITE( registry_tests, database_fixture )

/**
 * Create collections and verify the creator index
 */
BOOST_AUTO_TEST_CASE( collection_creation ) {
   try {
      ACTORS((alice)(bob));

      BOOST_TEST_MESSAGE("Alice is creating two collections");
      const collection_id_type art_id = create_collection(alice_id, "Art");
      BOOST_CHECK_EQUAL(art_id.instance, 1u);
      BOOST_REQUIRE_EQUAL(count_events<collection_created_event>(), 1u);
      BOOST_CHECK(get_event<collection_created_event>().collection_id == art_id);

      const collection_id_type music_id = create_collection(alice_id, "Music");
      BOOST_CHECK_EQUAL(music_id.instance, 2u);

      BOOST_TEST_MESSAGE("Bob is creating a collection");
      const collection_id_type bob_col_id = create_collection(bob_id, "Photos");
      BOOST_CHECK_EQUAL(bob_col_id.instance, 3u);

      BOOST_TEST_MESSAGE("Verifying the collections of each creator in creation order");
      const vector<collection_object> alice_collections = db.get_creator_collections(alice_id);
      BOOST_REQUIRE_EQUAL(alice_collections.size(), 2u);
      BOOST_CHECK(alice_collections[0].id == art_id);
      BOOST_CHECK_EQUAL(alice_collections[0].name, "Art");
      BOOST_CHECK(alice_collections[1].id == music_id);
      BOOST_CHECK_EQUAL(alice_collections[1].creator, alice_id);

      const vector<collection_object> bob_collections = db.get_creator_collections(bob_id);
      BOOST_REQUIRE_EQUAL(bob_collections.size(), 1u);
      BOOST_CHECK_EQUAL(bob_collections[0].name, "Photos");

      BOOST_CHECK(db.get_creator_collections("carol").empty());

      const collection_object* found = db.find_collection_by_name("Music");
      BOOST_REQUIRE(found != nullptr);
      BOOST_CHECK(found->id == music_id);
      BOOST_CHECK(db.find_collection_by_name("music") == nullptr);
   } FC_LOG_AND_RETHROW()
}

/**
 * Reject invalid collection names and duplicates
 */
BOOST_AUTO_TEST_CASE( collection_creation_invalid ) {
   try {
      ACTORS((alice)(bob));

      BOOST_TEST_MESSAGE("Rejecting an empty name");
      REQUIRE_EXCEPTION_WITH_TEXT(create_collection(alice_id, ""), "Name cannot be empty");
      CURIO_REQUIRE_THROW(create_collection(alice_id, ""), invalid_input_exception);

      BOOST_TEST_MESSAGE("Rejecting a name longer than 100 characters");
      REQUIRE_EXCEPTION_WITH_TEXT(create_collection(alice_id, string(101, 'x')), "Name is too long");
      CURIO_REQUIRE_THROW(create_collection(alice_id, string(101, 'x')), invalid_input_exception);
      {
         collection_create_operation op;
         op.creator = alice_id;
         op.name = string(101, 'x');
         try {
            op.validate();
            BOOST_FAIL("Expected an oversized name to be rejected");
         } catch (const invalid_input_exception &e) {
            BOOST_CHECK_EQUAL(e.top_message(), "Name is too long");
         }
      }

      BOOST_TEST_MESSAGE("Rejecting a malformed creator identity");
      REQUIRE_EXCEPTION_WITH_TEXT(create_collection("", "Art"), "Invalid creator account name");
      CURIO_REQUIRE_THROW(create_collection("", "Art"), invalid_input_exception);
      CURIO_REQUIRE_THROW(create_collection("bad name", "Art"), invalid_input_exception);

      BOOST_TEST_MESSAGE("Accepting a name of exactly 100 characters");
      const collection_id_type long_id = create_collection(alice_id, string(100, 'x'));
      BOOST_CHECK_EQUAL(long_id.instance, 1u);

      BOOST_TEST_MESSAGE("Rejecting a duplicate name, even from another creator");
      create_collection(alice_id, "Art");
      REQUIRE_EXCEPTION_WITH_TEXT(create_collection(bob_id, "Art"), "Collection already exists");
      CURIO_REQUIRE_THROW(create_collection(alice_id, "Art"), conflict_exception);

      BOOST_TEST_MESSAGE("Names are case-sensitive");
      create_collection(bob_id, "ART");

      BOOST_TEST_MESSAGE("Failed creations do not consume identifiers");
      const collection_id_type next_id = create_collection(bob_id, "Sculpture");
      BOOST_CHECK_EQUAL(next_id.instance, 4u);
      BOOST_CHECK(db.get_creator_collections(alice_id).size() == 2u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Mint items and verify the owner and collection indices
 */
BOOST_AUTO_TEST_CASE( nft_minting ) {
   try {
      ACTORS((alice)(bob));

      const collection_id_type art_id = create_collection(alice_id, "Art");
      const collection_id_type music_id = create_collection(bob_id, "Music");

      BOOST_TEST_MESSAGE("Alice is minting two items");
      const nft_id_type token1 = mint_nft(alice_id, art_id, "Sunrise", 100);
      BOOST_CHECK_EQUAL(token1.instance, 1u);
      BOOST_CHECK(get_event<nft_minted_event>().token_id == token1);
      const nft_id_type token2 = mint_nft(alice_id, art_id, "Sunset", 200);
      BOOST_CHECK_EQUAL(token2.instance, 2u);

      BOOST_TEST_MESSAGE("Alice is minting into Bob's collection");
      const nft_id_type token3 = mint_nft(alice_id, music_id, "Song", 50);

      BOOST_TEST_MESSAGE("Verifying the item properties");
      const nft_object& nft1 = db.get_nft(token1);
      BOOST_CHECK(nft1.collection == art_id);
      BOOST_CHECK_EQUAL(nft1.name, "Sunrise");
      BOOST_CHECK_EQUAL(nft1.mint_price.value, 100);
      BOOST_CHECK_EQUAL(nft1.owner, alice_id);

      BOOST_TEST_MESSAGE("Verifying the owner index in minting order");
      const vector<nft_object> owned = db.get_nfts_by_owner(alice_id);
      BOOST_REQUIRE_EQUAL(owned.size(), 3u);
      BOOST_CHECK(owned[0].id == token1);
      BOOST_CHECK(owned[1].id == token2);
      BOOST_CHECK(owned[2].id == token3);
      BOOST_CHECK(db.get_nfts_by_owner(bob_id).empty());

      BOOST_TEST_MESSAGE("Verifying the collection index");
      const vector<nft_object> in_art = db.get_nfts_by_collection(art_id);
      BOOST_REQUIRE_EQUAL(in_art.size(), 2u);
      BOOST_CHECK(in_art[0].id == token1);
      BOOST_CHECK(in_art[1].id == token2);
      const vector<nft_object> in_music = db.get_nfts_by_collection(music_id);
      BOOST_REQUIRE_EQUAL(in_music.size(), 1u);
      BOOST_CHECK(in_music[0].id == token3);

      BOOST_CHECK(db.token_exists(token1));
      BOOST_CHECK(db.token_exists(token3));
      BOOST_CHECK(!db.token_exists(nft_id_type(4)));
      BOOST_CHECK(!db.token_exists(nft_id_type()));
   } FC_LOG_AND_RETHROW()
}

/**
 * Reject mints into unknown collections and mints with invalid properties
 */
BOOST_AUTO_TEST_CASE( nft_minting_invalid ) {
   try {
      ACTORS((alice));

      const collection_id_type art_id = create_collection(alice_id, "Art");

      REQUIRE_EXCEPTION_WITH_TEXT(mint_nft(alice_id, collection_id_type(99), "Lost", 100), "Invalid collection ID");
      CURIO_REQUIRE_THROW(mint_nft(alice_id, collection_id_type(99), "Lost", 100), not_found_exception);
      CURIO_REQUIRE_THROW(mint_nft(alice_id, collection_id_type(), "Lost", 100), not_found_exception);

      REQUIRE_EXCEPTION_WITH_TEXT(mint_nft(alice_id, art_id, "", 100), "Name cannot be empty");
      CURIO_REQUIRE_THROW(mint_nft(alice_id, art_id, "", 100), invalid_input_exception);

      REQUIRE_EXCEPTION_WITH_TEXT(mint_nft(alice_id, art_id, "Free", 0), "Price must be greater than 0");
      CURIO_REQUIRE_THROW(mint_nft(alice_id, art_id, "Free", 0), invalid_input_exception);
      CURIO_REQUIRE_THROW(mint_nft(alice_id, art_id, "Negative", -5), invalid_input_exception);

      BOOST_TEST_MESSAGE("Failed mints do not consume identifiers");
      const nft_id_type token = mint_nft(alice_id, art_id, "First", 1);
      BOOST_CHECK_EQUAL(token.instance, 1u);
      BOOST_CHECK_EQUAL(db.get_nfts_by_owner(alice_id).size(), 1u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Transfer items between owners
 */
BOOST_AUTO_TEST_CASE( nft_transfer ) {
   try {
      ACTORS((alice)(bob)(carol));

      const collection_id_type art_id = create_collection(alice_id, "Art");
      const nft_id_type token1 = mint_nft(alice_id, art_id, "One", 100);
      const nft_id_type token2 = mint_nft(alice_id, art_id, "Two", 100);
      const nft_id_type token3 = mint_nft(bob_id, art_id, "Three", 100);

      BOOST_TEST_MESSAGE("Alice is transferring an item to Bob");
      transfer_nft(alice_id, token1, bob_id);
      const nft_transferred_event transferred = get_event<nft_transferred_event>();
      BOOST_CHECK(transferred.token_id == token1);
      BOOST_CHECK_EQUAL(transferred.to, bob_id);

      BOOST_CHECK(db.verify_nft_ownership(token1, bob_id));
      BOOST_CHECK(!db.verify_nft_ownership(token1, alice_id));

      BOOST_TEST_MESSAGE("Verifying that the item moved between owner indices");
      const vector<nft_object> alice_owned = db.get_nfts_by_owner(alice_id);
      BOOST_REQUIRE_EQUAL(alice_owned.size(), 1u);
      BOOST_CHECK(alice_owned[0].id == token2);

      const vector<nft_object> bob_owned = db.get_nfts_by_owner(bob_id);
      BOOST_REQUIRE_EQUAL(bob_owned.size(), 2u);
      BOOST_CHECK(bob_owned[0].id == token3);
      BOOST_CHECK(bob_owned[1].id == token1);

      BOOST_TEST_MESSAGE("The collection index is unaffected by transfers");
      BOOST_CHECK_EQUAL(db.get_nfts_by_collection(art_id).size(), 3u);

      BOOST_TEST_MESSAGE("Rejecting a transfer by a non-owner");
      REQUIRE_EXCEPTION_WITH_TEXT(transfer_nft(alice_id, token1, carol_id), "Not token owner");
      CURIO_REQUIRE_THROW(transfer_nft(carol_id, token1, carol_id), unauthorized_exception);

      BOOST_TEST_MESSAGE("Rejecting a transfer of an unknown token");
      REQUIRE_EXCEPTION_WITH_TEXT(transfer_nft(alice_id, nft_id_type(42), bob_id), "Token does not exist");
      CURIO_REQUIRE_THROW(transfer_nft(alice_id, nft_id_type(42), bob_id), not_found_exception);

      BOOST_TEST_MESSAGE("Rejecting a transfer to an empty identity");
      CURIO_REQUIRE_THROW(transfer_nft(bob_id, token1, ""), invalid_input_exception);

      BOOST_TEST_MESSAGE("A transfer back places the item at the end of the holdings");
      transfer_nft(bob_id, token1, alice_id);
      const vector<nft_object> alice_again = db.get_nfts_by_owner(alice_id);
      BOOST_REQUIRE_EQUAL(alice_again.size(), 2u);
      BOOST_CHECK(alice_again[0].id == token2);
      BOOST_CHECK(alice_again[1].id == token1);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
