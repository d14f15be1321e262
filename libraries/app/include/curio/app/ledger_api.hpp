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

#include <curio/app/plugin.hpp>
#include <curio/chain/database.hpp>

#include <boost/program_options.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace curio { namespace app {

   using namespace curio::chain;

   /**
    * @brief Public entrypoints of the registry and the marketplace
    *
    * Every call names its caller explicitly and is serialized with every other call,
    * so operations submitted concurrently take effect one at a time in the order the
    * ledger lock is acquired.  A failed operation throws and leaves the ledger unchanged.
    */
   class ledger_api
   {
      public:
         ledger_api();
         ~ledger_api();

         void set_program_options( boost::program_options::options_description& command_line_options,
                                   boost::program_options::options_description& configuration_file_options )const;

         /**
          * @brief Create the database from the parsed options and initialize every registered plugin
          * @param options Parsed options; absent options take their defaults
          */
         void initialize( const boost::program_options::variables_map& options );
         void startup();
         void shutdown();

         template<typename PluginType>
         std::shared_ptr<PluginType> register_plugin()
         {
            auto plug = std::make_shared<PluginType>( *this );
            _plugins[plug->plugin_name()] = plug;
            return plug;
         }

         std::shared_ptr<abstract_plugin> get_plugin( const string& name )const;

         template<typename PluginType>
         std::shared_ptr<PluginType> get_plugin( const string& name ) const
         {
            std::shared_ptr<abstract_plugin> abs_plugin = get_plugin( name );
            std::shared_ptr<PluginType> result = std::dynamic_pointer_cast<PluginType>( abs_plugin );
            FC_ASSERT( result != std::shared_ptr<PluginType>(), "Unable to load plugin '${p}'", ("p",name) );
            return result;
         }

         std::shared_ptr<chain::database> chain_database()const { return _chain_db; }

         /// Hold the ledger lock for the lifetime of the returned guard
         std::unique_lock<std::mutex> lock()const { return std::unique_lock<std::mutex>( _mutex ); }

         /////////////
         // Registry
         /////////////

         collection_id_type create_collection( const account_name_type& caller, const string& name );

         nft_id_type mint_nft( const account_name_type& caller, collection_id_type collection,
                               const string& name, share_type price );

         void transfer_nft( const account_name_type& caller, nft_id_type token, const account_name_type& to );

         vector<collection_object> get_creator_collections( const account_name_type& account )const;
         vector<nft_object>        get_nfts_by_owner( const account_name_type& account )const;
         vector<nft_object>        get_nfts_by_collection( collection_id_type collection )const;
         bool                      token_exists( nft_id_type token )const;

         /// @return The item, or nothing if it was never minted
         optional<nft_object>        get_nft( nft_id_type token )const;
         optional<collection_object> get_collection( collection_id_type collection )const;
         optional<collection_object> find_collection_by_name( const string& name )const;

         ////////////////
         // Marketplace
         ////////////////

         void list_nft( const account_name_type& caller, nft_id_type token, share_type price );

         void cancel_listing( const account_name_type& caller, nft_id_type token );

         /**
          * @brief Buy a listed item
          * @param payment Funds offered, which must cover the listing price
          * @return Overpayment refunded to the caller
          */
         share_type buy_nft( const account_name_type& caller, nft_id_type token, share_type payment );

         void create_auction( const account_name_type& caller, nft_id_type token,
                              share_type starting_bid, uint32_t duration_seconds );

         void place_bid( const account_name_type& caller, nft_id_type token, share_type payment );

         void finalize_auction( const account_name_type& caller, nft_id_type token );

         auction_status check_auction_status( nft_id_type token )const;
         bool           verify_nft_ownership( nft_id_type token, const account_name_type& account )const;
         listing_object listings( nft_id_type token )const;
         auction_object auctions( nft_id_type token )const;

         //////////
         // Funds
         //////////

         /// Credit funds from outside the ledger
         void deposit( const account_name_type& account, share_type amount );

         void set_accepts_payments( const account_name_type& account, bool accepts );

         /// @return Amount moved from the pending credit into the balance
         share_type withdraw_credit( const account_name_type& account );

         share_type get_balance( const account_name_type& account )const;
         share_type get_pending_credit( const account_name_type& account )const;
         share_type get_escrow_balance()const;

         /// Advance ledger time
         void advance_time( uint32_t seconds );

      private:
         operation_result push( const operation& op );

         const chain::database& db()const;

         std::shared_ptr<chain::database> _chain_db;
         std::map<string, std::shared_ptr<abstract_plugin>> _plugins;
         mutable std::mutex _mutex;
         bool _running = false;
   };

} } // curio::app
