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
#include <curio/chain/database.hpp>

#include <fc/log/logger.hpp>

namespace curio {
   namespace chain {

      const account_object *database::find_account(const account_name_type &name) const {
         const auto &idx = get_index_type<account_index>().indices().get<by_account_name>();
         auto itr = idx.find(name);
         if (itr == idx.end())
            return nullptr;
         return &*itr;
      }

      const account_object &database::get_or_create_account(const account_name_type &name) {
         const account_object *acct = find_account(name);
         if (acct != nullptr)
            return *acct;

         CURIO_ASSERT(is_valid_account_name(name), invalid_input_exception,
                      "Invalid account name", ("name", name));
         return create<account_object>([&name](account_object &a) {
            a.name = name;
         });
      }

      share_type database::get_balance(const account_name_type &owner) const {
         const account_object *acct = find_account(owner);
         if (acct == nullptr)
            return share_type(0);
         return acct->balance;
      }

      bool database::accepts_payments(const account_name_type &name) const {
         const account_object *acct = find_account(name);
         return acct == nullptr || acct->accepts_payments;
      }

      void database::adjust_balance(const account_name_type &owner, share_type delta) {
         try {
            if (delta == 0)
               return;

            const account_object &acct = get_or_create_account(owner);
            CURIO_ASSERT(acct.balance + delta >= 0, invalid_input_exception,
                         "Insufficient balance",
                         ("owner", owner)("balance", acct.balance)("delta", delta));
            modify(acct, [delta](account_object &a) {
               a.balance += delta;
            });
         } FC_CAPTURE_AND_RETHROW((owner)(delta))
      }

      void database::escrow_deposit(const account_name_type &from, share_type amount) {
         FC_ASSERT(amount > 0, "Escrow deposits must be positive");
         adjust_balance(from, -amount);
         modify(get_global_properties(), [amount](global_property_object &gpo) {
            gpo.escrow_balance += amount;
         });
      }

      void database::escrow_release(const account_name_type &to, share_type amount) {
         if (amount == 0)
            return;

         const global_property_object &gpo = get_global_properties();
         FC_ASSERT(amount > 0 && amount <= gpo.escrow_balance,
                   "Escrow release of ${amount} exceeds the escrow balance of ${escrow}",
                   ("amount", amount)("escrow", gpo.escrow_balance));
         modify(gpo, [amount](global_property_object &g) {
            g.escrow_balance -= amount;
         });

         pay_out(to, amount);
      }

      void database::pay_out(const account_name_type &to, share_type amount) {
         if (amount == 0)
            return;

         if (accepts_payments(to)) {
            adjust_balance(to, amount);
            return;
         }

         wlog("Account ${a} does not accept payments, holding ${amount} as a pending credit",
              ("a", to)("amount", amount));

         const auto &idx = get_index_type<pending_credit_index>().indices().get<by_credit_owner>();
         auto itr = idx.find(to);
         if (itr == idx.end()) {
            create<pending_credit_object>([&to, amount](pending_credit_object &c) {
               c.owner = to;
               c.amount = amount;
            });
         } else {
            modify(*itr, [amount](pending_credit_object &c) {
               c.amount += amount;
            });
         }
         modify(get_global_properties(), [amount](global_property_object &gpo) {
            gpo.pending_credit_balance += amount;
         });

         push_event(payment_deferred_event{to, amount});
      }

      share_type database::get_pending_credit(const account_name_type &owner) const {
         const auto &idx = get_index_type<pending_credit_index>().indices().get<by_credit_owner>();
         auto itr = idx.find(owner);
         if (itr == idx.end())
            return share_type(0);
         return itr->amount;
      }

      share_type database::withdraw_pending_credit(const account_name_type &owner) {
         const auto &idx = get_index_type<pending_credit_index>().indices().get<by_credit_owner>();
         auto itr = idx.find(owner);
         CURIO_ASSERT(itr != idx.end() && itr->amount > 0, invalid_state_exception,
                      "No pending credit", ("owner", owner));

         const share_type amount = itr->amount;
         modify(*itr, [](pending_credit_object &c) {
            c.amount = 0;
         });
         modify(get_global_properties(), [amount](global_property_object &gpo) {
            gpo.pending_credit_balance -= amount;
         });
         adjust_balance(owner, amount);
         return amount;
      }

      share_type database::get_escrow_balance() const {
         return get_global_properties().escrow_balance;
      }

   }
} // curio::chain
