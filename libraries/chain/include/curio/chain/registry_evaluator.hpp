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

#include <curio/chain/evaluator.hpp>
#include <curio/chain/registry_object.hpp>
#include <curio/protocol/registry.hpp>

namespace curio {
   namespace chain {

      class collection_create_evaluator : public evaluator<collection_create_evaluator> {
      public:
         typedef collection_create_operation operation_type;

         void_result do_evaluate(const collection_create_operation &o);

         collection_id_type do_apply(const collection_create_operation &o);
      };

      class nft_mint_evaluator : public evaluator<nft_mint_evaluator> {
      public:
         typedef nft_mint_operation operation_type;

         void_result do_evaluate(const nft_mint_operation &o);

         nft_id_type do_apply(const nft_mint_operation &o);
      };

      class nft_transfer_evaluator : public evaluator<nft_transfer_evaluator> {
      public:
         typedef nft_transfer_operation operation_type;

         void_result do_evaluate(const nft_transfer_operation &o);

         void_result do_apply(const nft_transfer_operation &o);

         const nft_object *ptr_token_obj = nullptr;
      };

   } // namespace chain
} // namespace curio
