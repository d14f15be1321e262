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
#include <curio/app/ledger_api.hpp>

#include <fc/log/logger.hpp>

namespace curio {
   namespace app {

      namespace bpo = boost::program_options;

      ledger_api::ledger_api() {
      }

      ledger_api::~ledger_api() {
         if (_running)
            shutdown();
      }

      void ledger_api::set_program_options(bpo::options_description &command_line_options,
                                            bpo::options_description &configuration_file_options) const {
         chain_parameters::set_program_options(configuration_file_options);

         for (const auto &entry : _plugins) {
            bpo::options_description plugin_cli_options("Options for plugin " + entry.first);
            bpo::options_description plugin_cfg_options("Options for plugin " + entry.first);
            entry.second->plugin_set_program_options(plugin_cli_options, plugin_cfg_options);
            if (!plugin_cli_options.options().empty())
               command_line_options.add(plugin_cli_options);
            if (!plugin_cfg_options.options().empty())
               configuration_file_options.add(plugin_cfg_options);
         }
      }

      void ledger_api::initialize(const bpo::variables_map &options) {
         try {
            FC_ASSERT(!_chain_db, "Ledger is already initialized");

            const chain_parameters params = chain_parameters::from_options(options);
            ilog("Initializing ledger with auction finalize policy ${p} and minimum bid increment ${i}",
                 ("p", to_string(params.finalize_policy))("i", params.min_bid_increment_centipercent));
            _chain_db = std::make_shared<chain::database>(params);

            for (const auto &entry : _plugins) {
               ilog("Initializing plugin ${name}", ("name", entry.first));
               entry.second->plugin_initialize(options);
            }
         } FC_LOG_AND_RETHROW()
      }

      void ledger_api::startup() {
         FC_ASSERT(_chain_db, "Ledger is not initialized");
         for (const auto &entry : _plugins) {
            ilog("Starting plugin ${name}", ("name", entry.first));
            entry.second->plugin_startup();
         }
         _running = true;
      }

      void ledger_api::shutdown() {
         for (const auto &entry : _plugins) {
            try {
               entry.second->plugin_shutdown();
            } FC_CAPTURE_AND_LOG((entry.first))
         }
         _running = false;
      }

      std::shared_ptr<abstract_plugin> ledger_api::get_plugin(const string &name) const {
         auto itr = _plugins.find(name);
         if (itr == _plugins.end())
            return std::shared_ptr<abstract_plugin>();
         return itr->second;
      }

      const chain::database &ledger_api::db() const {
         FC_ASSERT(_chain_db, "Ledger is not initialized");
         return *_chain_db;
      }

      operation_result ledger_api::push(const operation &op) {
         FC_ASSERT(_chain_db, "Ledger is not initialized");
         return _chain_db->push_operation(op);
      }

      collection_id_type ledger_api::create_collection(const account_name_type &caller, const string &name) {
         std::lock_guard<std::mutex> guard(_mutex);
         collection_create_operation op;
         op.creator = caller;
         op.name = name;
         return push(op).get<collection_id_type>();
      }

      nft_id_type ledger_api::mint_nft(const account_name_type &caller, collection_id_type collection,
                                        const string &name, share_type price) {
         std::lock_guard<std::mutex> guard(_mutex);
         nft_mint_operation op;
         op.issuer = caller;
         op.collection = collection;
         op.name = name;
         op.price = price;
         return push(op).get<nft_id_type>();
      }

      void ledger_api::transfer_nft(const account_name_type &caller, nft_id_type token, const account_name_type &to) {
         std::lock_guard<std::mutex> guard(_mutex);
         nft_transfer_operation op;
         op.from = caller;
         op.token = token;
         op.to = to;
         push(op);
      }

      vector<collection_object> ledger_api::get_creator_collections(const account_name_type &account) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_creator_collections(account);
      }

      vector<nft_object> ledger_api::get_nfts_by_owner(const account_name_type &account) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_nfts_by_owner(account);
      }

      vector<nft_object> ledger_api::get_nfts_by_collection(collection_id_type collection) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_nfts_by_collection(collection);
      }

      bool ledger_api::token_exists(nft_id_type token) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().token_exists(token);
      }

      optional<nft_object> ledger_api::get_nft(nft_id_type token) const {
         std::lock_guard<std::mutex> guard(_mutex);
         optional<nft_object> result;
         const nft_object *nft = db().find_nft(token);
         if (nft != nullptr)
            result = *nft;
         return result;
      }

      optional<collection_object> ledger_api::get_collection(collection_id_type collection) const {
         std::lock_guard<std::mutex> guard(_mutex);
         optional<collection_object> result;
         const collection_object *c = db().find_collection(collection);
         if (c != nullptr)
            result = *c;
         return result;
      }

      optional<collection_object> ledger_api::find_collection_by_name(const string &name) const {
         std::lock_guard<std::mutex> guard(_mutex);
         optional<collection_object> result;
         const collection_object *c = db().find_collection_by_name(name);
         if (c != nullptr)
            result = *c;
         return result;
      }

      void ledger_api::list_nft(const account_name_type &caller, nft_id_type token, share_type price) {
         std::lock_guard<std::mutex> guard(_mutex);
         listing_create_operation op;
         op.seller = caller;
         op.token = token;
         op.price = price;
         push(op);
      }

      void ledger_api::cancel_listing(const account_name_type &caller, nft_id_type token) {
         std::lock_guard<std::mutex> guard(_mutex);
         listing_cancel_operation op;
         op.seller = caller;
         op.token = token;
         push(op);
      }

      share_type ledger_api::buy_nft(const account_name_type &caller, nft_id_type token, share_type payment) {
         std::lock_guard<std::mutex> guard(_mutex);
         nft_buy_operation op;
         op.buyer = caller;
         op.token = token;
         op.payment = payment;
         return push(op).get<share_type>();
      }

      void ledger_api::create_auction(const account_name_type &caller, nft_id_type token,
                                       share_type starting_bid, uint32_t duration_seconds) {
         std::lock_guard<std::mutex> guard(_mutex);
         auction_create_operation op;
         op.creator = caller;
         op.token = token;
         op.starting_bid = starting_bid;
         op.duration_seconds = duration_seconds;
         push(op);
      }

      void ledger_api::place_bid(const account_name_type &caller, nft_id_type token, share_type payment) {
         std::lock_guard<std::mutex> guard(_mutex);
         auction_bid_operation op;
         op.bidder = caller;
         op.token = token;
         op.amount = payment;
         push(op);
      }

      void ledger_api::finalize_auction(const account_name_type &caller, nft_id_type token) {
         std::lock_guard<std::mutex> guard(_mutex);
         auction_finalize_operation op;
         op.finalizer = caller;
         op.token = token;
         push(op);
      }

      auction_status ledger_api::check_auction_status(nft_id_type token) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().check_auction_status(token);
      }

      bool ledger_api::verify_nft_ownership(nft_id_type token, const account_name_type &account) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().verify_nft_ownership(token, account);
      }

      listing_object ledger_api::listings(nft_id_type token) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_listing(token);
      }

      auction_object ledger_api::auctions(nft_id_type token) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_auction(token);
      }

      void ledger_api::deposit(const account_name_type &account, share_type amount) {
         std::lock_guard<std::mutex> guard(_mutex);
         CURIO_ASSERT(amount > 0, invalid_input_exception, "Deposit must be greater than 0", ("amount", amount));
         FC_ASSERT(_chain_db, "Ledger is not initialized");
         _chain_db->adjust_balance(account, amount);
      }

      void ledger_api::set_accepts_payments(const account_name_type &account, bool accepts) {
         std::lock_guard<std::mutex> guard(_mutex);
         account_update_operation op;
         op.account = account;
         op.accepts_payments = accepts;
         push(op);
      }

      share_type ledger_api::withdraw_credit(const account_name_type &account) {
         std::lock_guard<std::mutex> guard(_mutex);
         credit_withdraw_operation op;
         op.account = account;
         return push(op).get<share_type>();
      }

      share_type ledger_api::get_balance(const account_name_type &account) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_balance(account);
      }

      share_type ledger_api::get_pending_credit(const account_name_type &account) const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_pending_credit(account);
      }

      share_type ledger_api::get_escrow_balance() const {
         std::lock_guard<std::mutex> guard(_mutex);
         return db().get_escrow_balance();
      }

      void ledger_api::advance_time(uint32_t seconds) {
         std::lock_guard<std::mutex> guard(_mutex);
         FC_ASSERT(_chain_db, "Ledger is not initialized");
         _chain_db->advance_time(seconds);
      }
   }
} // curio::app
