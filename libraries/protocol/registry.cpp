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
#include <curio/protocol/registry.hpp>

namespace curio {
   namespace protocol {
      void collection_create_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(creator), invalid_input_exception,
                      "Invalid creator account name", ("creator", creator));
         CURIO_ASSERT(!name.empty(), invalid_input_exception, "Name cannot be empty", ("creator", creator));
         CURIO_ASSERT(name.size() <= CURIO_MAX_NAME_LENGTH, invalid_input_exception,
                      "Name is too long",
                      ("length", name.size())("max", CURIO_MAX_NAME_LENGTH));
      }

      void nft_mint_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(issuer), invalid_input_exception,
                      "Invalid issuer account name", ("issuer", issuer));
         CURIO_ASSERT(!name.empty(), invalid_input_exception, "Name cannot be empty", ("issuer", issuer));
         CURIO_ASSERT(price > 0, invalid_input_exception, "Price must be greater than 0", ("price", price));
         CURIO_ASSERT(price <= CURIO_MAX_SHARE_SUPPLY, invalid_input_exception,
                      "Price exceeds the maximum share supply", ("price", price));
      }

      void nft_transfer_operation::validate() const {
         CURIO_ASSERT(is_valid_account_name(from), invalid_input_exception,
                      "Invalid sender account name", ("from", from));
         CURIO_ASSERT(is_valid_account_name(to), invalid_input_exception,
                      "Invalid recipient account name", ("to", to));
      }
   }
}
