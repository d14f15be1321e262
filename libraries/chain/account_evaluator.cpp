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
#include <curio/chain/account_evaluator.hpp>
#include <curio/chain/database.hpp>

namespace curio {
   namespace chain {
      void_result account_update_evaluator::do_evaluate(const account_update_operation &op) {
         return void_result();
      }

      void_result account_update_evaluator::do_apply(const account_update_operation &op) {
         try {
            database &d = db();

            const account_object &acct = d.get_or_create_account(op.account);
            d.modify(acct, [&op](account_object &a) {
               a.accepts_payments = op.accepts_payments;
            });

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result credit_withdraw_evaluator::do_evaluate(const credit_withdraw_operation &op) {
         try {
            const database &d = db();

            CURIO_ASSERT(d.get_pending_credit(op.account) > 0, invalid_state_exception,
                         "No pending credit", ("account", op.account));
            CURIO_ASSERT(d.accepts_payments(op.account), invalid_state_exception,
                         "Account does not accept payments", ("account", op.account));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      share_type credit_withdraw_evaluator::do_apply(const credit_withdraw_operation &op) {
         try {
            return db().withdraw_pending_credit(op.account);
         } FC_CAPTURE_AND_RETHROW((op))
      }
   }
}
