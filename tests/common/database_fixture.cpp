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
#include "database_fixture.hpp"

namespace curio { namespace chain { namespace test {

namespace {
   chain_parameters make_parameters( auction_finalize_policy policy, uint16_t increment = 0 )
   {
      chain_parameters params;
      params.finalize_policy = policy;
      params.min_bid_increment_centipercent = increment;
      return params;
   }
}

database_fixture::database_fixture()
   : database_fixture( chain_parameters() )
{
}

database_fixture::database_fixture( const chain_parameters& params )
   : db( params ), total_deposited( 0 )
{
   db.set_head_time( fc::time_point_sec( 1700000000 ) );
}

database_fixture::~database_fixture()
{
}

void database_fixture::fund( const account_name_type& account, share_type amount )
{
   db.adjust_balance( account, amount );
   total_deposited += amount;
}

void database_fixture::generate_blocks( uint32_t seconds )
{
   db.advance_time( seconds );
}

collection_id_type database_fixture::create_collection( const account_name_type& creator, const string& name )
{
   collection_create_operation op;
   op.creator = creator;
   op.name = name;
   return PUSH_OP( db, op ).get<collection_id_type>();
}

nft_id_type database_fixture::mint_nft( const account_name_type& issuer, collection_id_type collection,
                                        const string& name, share_type price )
{
   nft_mint_operation op;
   op.issuer = issuer;
   op.collection = collection;
   op.name = name;
   op.price = price;
   return PUSH_OP( db, op ).get<nft_id_type>();
}

void database_fixture::transfer_nft( const account_name_type& from, nft_id_type token, const account_name_type& to )
{
   nft_transfer_operation op;
   op.from = from;
   op.token = token;
   op.to = to;
   PUSH_OP( db, op );
}

void database_fixture::list_nft( const account_name_type& seller, nft_id_type token, share_type price )
{
   listing_create_operation op;
   op.seller = seller;
   op.token = token;
   op.price = price;
   PUSH_OP( db, op );
}

void database_fixture::cancel_listing( const account_name_type& seller, nft_id_type token )
{
   listing_cancel_operation op;
   op.seller = seller;
   op.token = token;
   PUSH_OP( db, op );
}

share_type database_fixture::buy_nft( const account_name_type& buyer, nft_id_type token, share_type payment )
{
   nft_buy_operation op;
   op.buyer = buyer;
   op.token = token;
   op.payment = payment;
   return PUSH_OP( db, op ).get<share_type>();
}

void database_fixture::create_auction( const account_name_type& creator, nft_id_type token,
                                       share_type starting_bid, uint32_t duration_seconds )
{
   auction_create_operation op;
   op.creator = creator;
   op.token = token;
   op.starting_bid = starting_bid;
   op.duration_seconds = duration_seconds;
   PUSH_OP( db, op );
}

void database_fixture::place_bid( const account_name_type& bidder, nft_id_type token, share_type amount )
{
   auction_bid_operation op;
   op.bidder = bidder;
   op.token = token;
   op.amount = amount;
   PUSH_OP( db, op );
}

void database_fixture::finalize_auction( const account_name_type& finalizer, nft_id_type token )
{
   auction_finalize_operation op;
   op.finalizer = finalizer;
   op.token = token;
   PUSH_OP( db, op );
}

void database_fixture::set_accepts_payments( const account_name_type& account, bool accepts )
{
   account_update_operation op;
   op.account = account;
   op.accepts_payments = accepts;
   PUSH_OP( db, op );
}

share_type database_fixture::withdraw_credit( const account_name_type& account )
{
   credit_withdraw_operation op;
   op.account = account;
   return PUSH_OP( db, op ).get<share_type>();
}

share_type database_fixture::total_funds()const
{
   share_type total = db.get_escrow_balance();
   for( const account_object& a : db.get_index_type<account_index>().indices() )
      total += a.balance;
   for( const pending_credit_object& c : db.get_index_type<pending_credit_index>().indices() )
      total += c.amount;
   return total;
}

void database_fixture::verify_conservation()const
{
   BOOST_CHECK_EQUAL( total_funds().value, total_deposited.value );

   share_type pending;
   for( const pending_credit_object& c : db.get_index_type<pending_credit_index>().indices() )
      pending += c.amount;
   BOOST_CHECK_EQUAL( pending.value, db.get_global_properties().pending_credit_balance.value );
}

creator_finalize_fixture::creator_finalize_fixture()
   : database_fixture( make_parameters( finalize_by_creator ) )
{
}

participants_finalize_fixture::participants_finalize_fixture()
   : database_fixture( make_parameters( finalize_by_participants ) )
{
}

bid_increment_fixture::bid_increment_fixture()
   : database_fixture( make_parameters( finalize_by_anyone, 5 * CURIO_1_PERCENT ) )
{
}

} } } // curio::chain::test
