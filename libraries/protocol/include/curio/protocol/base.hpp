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

#include <curio/protocol/types.hpp>
#include <curio/protocol/exceptions.hpp>

namespace curio {
   namespace protocol {

      /**
       *  @brief Common base of every ledger operation
       *
       *  Each operation names the account on whose behalf it executes through caller().
       *  Stateless checks belong in validate(); checks that consult ledger state belong
       *  in the evaluator.
       */
      struct base_operation {
         void validate() const {}
      };

      typedef fc::static_variant<
         void_result,
         collection_id_type,
         nft_id_type,
         share_type
      > operation_result;

   }
} // curio::protocol

FC_REFLECT_TYPENAME( curio::protocol::operation_result )
