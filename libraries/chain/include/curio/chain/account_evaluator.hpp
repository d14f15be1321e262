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
#include <curio/chain/evaluator.hpp>
#include <curio/protocol/account.hpp>

namespace curio {
   namespace chain {

      class account_update_evaluator : public evaluator<account_update_evaluator> {
      public:
         typedef account_update_operation operation_type;

         void_result do_evaluate(const account_update_operation &o);

         void_result do_apply(const account_update_operation &o);
      };

      class credit_withdraw_evaluator : public evaluator<credit_withdraw_evaluator> {
      public:
         typedef credit_withdraw_operation operation_type;

         void_result do_evaluate(const credit_withdraw_operation &o);

         /// @return Amount moved into the account's balance
         share_type do_apply(const credit_withdraw_operation &o);
      };

   } // namespace chain
} // namespace curio
