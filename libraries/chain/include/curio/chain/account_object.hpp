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
#include <curio/db/generic_index.hpp>

namespace curio {
   namespace chain {

      using namespace curio::db;

      /**
       *  @brief Funds held by an account
       *  @ingroup object
       *
       *  Created the first time funds move into or out of the account, or when
       *  its payment policy is first set.
       */
      class account_object {
      public:
         static constexpr uint8_t type_id = account_object_type;
         typedef account_id_type id_type;

         account_id_type id;

         account_name_type name;

         share_type balance;

         /// When false, payouts owed to the account are held as a pending credit
         bool accepts_payments = true;
      };

      struct by_account_name;
      typedef multi_index_container<
         account_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< account_object, account_id_type, &account_object::id > >,
            ordered_unique< tag<by_account_name>, member<account_object, account_name_type, &account_object::name> >
         >
      > account_multi_index_type;
      typedef generic_index<account_object, account_multi_index_type> account_index;


      /**
       *  @brief Funds owed by the marketplace to an account that could not receive them
       *  @ingroup object
       */
      class pending_credit_object {
      public:
         static constexpr uint8_t type_id = pending_credit_object_type;
         typedef pending_credit_id_type id_type;

         pending_credit_id_type id;

         account_name_type owner;

         share_type amount;
      };

      struct by_credit_owner;
      typedef multi_index_container<
         pending_credit_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< pending_credit_object, pending_credit_id_type, &pending_credit_object::id > >,
            ordered_unique< tag<by_credit_owner>, member<pending_credit_object, account_name_type, &pending_credit_object::owner> >
         >
      > pending_credit_multi_index_type;
      typedef generic_index<pending_credit_object, pending_credit_multi_index_type> pending_credit_index;

   }
} // curio::chain

FC_REFLECT( curio::chain::account_object, (id)(name)(balance)(accepts_payments) )
FC_REFLECT( curio::chain::pending_credit_object, (id)(owner)(amount) )
