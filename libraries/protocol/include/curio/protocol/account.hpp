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

#include <curio/protocol/base.hpp>

namespace curio {
   namespace protocol {
      /**
       * @brief Control whether payouts may be pushed to an account
       *
       * While an account refuses payments, every payout owed to it is held by the
       * marketplace as a pending credit.
       */
      struct account_update_operation : public base_operation {
         account_name_type account;

         bool accepts_payments = true;

         void validate() const;

         account_name_type caller() const { return account; }
      };

      /**
       * @brief Claim the pending credit held for an account
       */
      struct credit_withdraw_operation : public base_operation {
         account_name_type account;

         void validate() const;

         account_name_type caller() const { return account; }
      };

   }
}

FC_REFLECT( curio::protocol::account_update_operation, (account)(accepts_payments) )
FC_REFLECT( curio::protocol::credit_withdraw_operation, (account) )
