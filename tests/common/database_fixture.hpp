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

#include <curio/chain/database.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/test/unit_test.hpp>

#include <fc/log/logger.hpp>

#include <iostream>

#define PUSH_OP( db, op ) (db).push_operation( op )

#define CURIO_REQUIRE_THROW( expr, exc_type )                      \
{                                                                  \
   dlog( "CURIO_REQUIRE_THROW begin ${expr}", ("expr", #expr) );   \
   BOOST_REQUIRE_THROW( expr, exc_type );                          \
}

#define CURIO_CHECK_THROW( expr, exc_type )                        \
{                                                                  \
   dlog( "CURIO_CHECK_THROW begin ${expr}", ("expr", #expr) );     \
   BOOST_CHECK_THROW( expr, exc_type );                            \
}

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                  \
{                                                                  \
   try                                                             \
   {                                                               \
      op;                                                          \
      BOOST_FAIL(std::string("Expected an exception with \"") +    \
                 std::string(exc_text) +                           \
                 std::string("\" but none thrown"));               \
   }                                                               \
   catch (fc::exception& e)                                        \
   {                                                               \
      std::string what = e.to_string(fc::log_level::all);          \
      if (what.find(exc_text) == std::string::npos)                \
      {                                                            \
         BOOST_FAIL(std::string("Expected \"") +                   \
                    std::string(exc_text) +                        \
                    std::string("\" but got \"") +                 \
                    std::string(what));                            \
      }                                                            \
   }                                                               \
}

#define ACTOR(name) \
   const curio::protocol::account_name_type name##_id( BOOST_PP_STRINGIZE(name) );

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

namespace curio { namespace chain { namespace test {

struct database_fixture {
   database db;

   /// Funds credited from outside the ledger through fund()
   share_type total_deposited;

   database_fixture();
   explicit database_fixture( const chain_parameters& params );
   ~database_fixture();

   void fund( const account_name_type& account, share_type amount );

   /// Advance ledger time
   void generate_blocks( uint32_t seconds );

   collection_id_type create_collection( const account_name_type& creator, const string& name );
   nft_id_type mint_nft( const account_name_type& issuer, collection_id_type collection,
                         const string& name, share_type price );
   void transfer_nft( const account_name_type& from, nft_id_type token, const account_name_type& to );

   void list_nft( const account_name_type& seller, nft_id_type token, share_type price );
   void cancel_listing( const account_name_type& seller, nft_id_type token );
   share_type buy_nft( const account_name_type& buyer, nft_id_type token, share_type payment );

   void create_auction( const account_name_type& creator, nft_id_type token,
                        share_type starting_bid, uint32_t duration_seconds );
   void place_bid( const account_name_type& bidder, nft_id_type token, share_type amount );
   void finalize_auction( const account_name_type& finalizer, nft_id_type token );

   void set_accepts_payments( const account_name_type& account, bool accepts );
   share_type withdraw_credit( const account_name_type& account );

   /// Sum of every balance, the escrow and every pending credit
   share_type total_funds()const;

   /// Verify that no funds were created or destroyed
   void verify_conservation()const;

   /// Number of events of the given type emitted by the last committed operation
   template<typename EventType>
   size_t count_events()const
   {
      size_t count = 0;
      for( const market_event& e : db.get_applied_events() )
         if( e.which() == market_event::tag<EventType>::value )
            ++count;
      return count;
   }

   /// The only event of the given type emitted by the last committed operation
   template<typename EventType>
   EventType get_event()const
   {
      BOOST_REQUIRE_EQUAL( count_events<EventType>(), 1u );
      for( const market_event& e : db.get_applied_events() )
         if( e.which() == market_event::tag<EventType>::value )
            return e.get<EventType>();
      return EventType();
   }
};

/// Ledger whose auctions may be finalized only by their creators
struct creator_finalize_fixture : database_fixture {
   creator_finalize_fixture();
};

/// Ledger whose auctions may be finalized by their creators or highest bidders
struct participants_finalize_fixture : database_fixture {
   participants_finalize_fixture();
};

/// Ledger that requires every bid to beat the highest bid by 5%
struct bid_increment_fixture : database_fixture {
   bid_increment_fixture();
};

} } } // curio::chain::test
