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

#include <curio/chain/account_object.hpp>
#include <curio/chain/chain_parameters.hpp>
#include <curio/chain/evaluator.hpp>
#include <curio/chain/global_property_object.hpp>
#include <curio/chain/market_object.hpp>
#include <curio/chain/registry_object.hpp>

#include <curio/db/undo_database.hpp>

#include <curio/protocol/events.hpp>
#include <curio/protocol/operations.hpp>

#include <boost/signals2/signal.hpp>

#include <memory>

namespace curio {
   namespace chain {

      /**
       * @brief Record of one committed operation
       */
      struct operation_history_object {
         /// Position of the operation in the ledger, starting at 1
         uint64_t sequence = 0;
         time_point_sec timestamp;
         operation op;
         operation_result result;
         /// Events emitted by the operation in emission order
         vector<market_event> events;
      };

      /**
       *   @class database
       *   @brief tracks the ledger state of the registry and the marketplace
       *
       *   Every state change enters through push_operation().  An operation either commits
       *   completely, after which applied_operation is notified, or leaves no trace at all.
       */
      class database {
      public:
         explicit database(const chain_parameters &params = chain_parameters());

         ~database();

         /**
          * @brief Validate, evaluate and apply one operation as a single atomic unit
          * @param op Operation
          * @return Result of the operation's evaluator
          */
         operation_result push_operation(const operation &op);

         /**
          *  This signal is emitted after an operation has been committed.  Subscribers
          *  observe the committed state and may not modify it.
          */
         boost::signals2::signal<void(const operation_history_object &)> applied_operation;

         /// Events emitted by the most recently committed operation
         const vector<market_event> &get_applied_events() const { return _applied_events; }

         /// Append an event to the operation being applied
         void push_event(const market_event &e);

         /// @{ @group Time
         time_point_sec head_block_time() const;

         void set_head_time(time_point_sec t);

         void advance_time(uint32_t seconds);
         /// @}

         const chain_parameters &get_chain_parameters() const { return _params; }

         const global_property_object &get_global_properties() const;

         /// @{ @group Object access
         template<typename IndexType>
         const IndexType &get_index_type() const {
            return static_cast<const IndexType &>(*_indexes[IndexType::object_type::type_id]);
         }

         template<typename T>
         const T *find(typename T::id_type id) const {
            return get_index<T>().find(id);
         }

         template<typename T>
         const T &get(typename T::id_type id) const {
            return get_index<T>().get(id);
         }

         template<typename T, typename F>
         const T &create(F &&constructor) {
            return get_mutable_index<T>().create(std::function<void(T &)>(std::forward<F>(constructor)));
         }

         template<typename T, typename Lambda>
         void modify(const T &obj, const Lambda &m) {
            get_mutable_index<T>().modify(obj, std::function<void(T &)>(m));
         }
         /// @}

         //////////////////// db_registry.cpp ////////////////////

         /**
          * @brief Look up an item
          * @param token Token ID
          * @return Item, or nullptr if it was never minted
          */
         const nft_object *find_nft(nft_id_type token) const;

         /// Like find_nft() but throws not_found_exception for an unknown token
         const nft_object &get_nft(nft_id_type token) const;

         const collection_object *find_collection(collection_id_type collection) const;

         const collection_object &get_collection(collection_id_type collection) const;

         const collection_object *find_collection_by_name(const string &name) const;

         /**
          * @brief Move an item to a new owner
          *
          * This is the only place where the owner of an item changes.  The item is appended
          * to the end of the new owner's holdings.
          */
         void transfer_nft(const nft_object &token, const account_name_type &to);

         /// Next position for an item entering an owner's holdings
         uint64_t next_acquired_seq();

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's balance
          * @param owner Account whose balance should be retrieved
          * @return Balance, zero for an account that never held funds
          */
         share_type get_balance(const account_name_type &owner) const;

         /**
          * @brief Adjust a particular account's balance
          * @param owner Account whose balance should be adjusted
          * @param delta Amount to add or, if negative, remove.  The balance may not become negative.
          */
         void adjust_balance(const account_name_type &owner, share_type delta);

         const account_object *find_account(const account_name_type &name) const;

         const account_object &get_or_create_account(const account_name_type &name);

         bool accepts_payments(const account_name_type &name) const;

         /// Move funds from an account's balance into marketplace escrow
         void escrow_deposit(const account_name_type &from, share_type amount);

         /// Pay funds held in escrow out to an account
         void escrow_release(const account_name_type &to, share_type amount);

         /**
          * @brief Deliver funds owed by the marketplace
          *
          * Funds owed to an account that does not accept payments are held as a pending
          * credit instead and a payment_deferred_event is emitted.
          */
         void pay_out(const account_name_type &to, share_type amount);

         share_type get_pending_credit(const account_name_type &owner) const;

         /**
          * @brief Move the whole pending credit of an account into its balance
          * @return Amount moved
          */
         share_type withdraw_pending_credit(const account_name_type &owner);

         share_type get_escrow_balance() const;

         //////////////////// db_getter.cpp ////////////////////

         vector<collection_object> get_creator_collections(const account_name_type &creator) const;

         vector<nft_object> get_nfts_by_owner(const account_name_type &owner) const;

         vector<nft_object> get_nfts_by_collection(collection_id_type collection) const;

         bool token_exists(nft_id_type token) const;

         bool verify_nft_ownership(nft_id_type token, const account_name_type &account) const;

         const listing_object *find_listing(nft_id_type token) const;

         /// Listing record of an item; a cleared record if the item was never listed
         listing_object get_listing(nft_id_type token) const;

         bool is_listed(nft_id_type token) const;

         const auction_object *find_auction(nft_id_type token) const;

         /// Auction record of an item; an inactive record if the item was never auctioned
         auction_object get_auction(nft_id_type token) const;

         bool is_auctioned(nft_id_type token) const;

         auction_status check_auction_status(nft_id_type token) const;

      private:
         template<typename T>
         const curio::db::index<T> &get_index() const {
            return static_cast<const curio::db::index<T> &>(*_indexes[T::type_id]);
         }

         template<typename T>
         curio::db::index<T> &get_mutable_index() {
            return static_cast<curio::db::index<T> &>(*_indexes[T::type_id]);
         }

         template<typename IndexType>
         void add_index() {
            std::unique_ptr<curio::db::abstract_index> idx(new IndexType());
            _undo_db.add_index(idx.get());
            _indexes[IndexType::object_type::type_id] = std::move(idx);
         }

         void initialize_indexes();

         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator() {
            _operation_evaluators[operation::tag<typename EvaluatorType::operation_type>::value].reset(
               new op_evaluator_impl<EvaluatorType>());
         }

         chain_parameters _params;

         curio::db::undo_database _undo_db;
         vector<std::unique_ptr<curio::db::abstract_index>> _indexes;
         vector<std::unique_ptr<op_evaluator>> _operation_evaluators;

         vector<market_event> _pending_events;
         vector<market_event> _applied_events;
      };

   }
} // curio::chain

FC_REFLECT( curio::chain::operation_history_object, (sequence)(timestamp)(op)(result)(events) )
