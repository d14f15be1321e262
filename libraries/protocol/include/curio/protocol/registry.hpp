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
      struct collection_create_operation : public base_operation {
         /// Account creating the collection
         account_name_type creator;

         /// Name of the collection, unique across the whole registry
         string name;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_name_type caller() const { return creator; }
      };

      struct nft_mint_operation : public base_operation {
         /// Account minting the item.  It becomes the first owner.
         account_name_type issuer;

         /// Collection into which the item is minted
         collection_id_type collection;

         /// Name of the item
         string name;

         /// Mint price, which is also the floor for every future sale of the item
         share_type price;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_name_type caller() const { return issuer; }
      };

      struct nft_transfer_operation : public base_operation {
         /// Current owner of the item
         account_name_type from;

         /// Item to transfer
         nft_id_type token;

         /// New owner of the item
         account_name_type to;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;

         account_name_type caller() const { return from; }
      };

   }
}

FC_REFLECT( curio::protocol::collection_create_operation, (creator)(name) )
FC_REFLECT( curio::protocol::nft_mint_operation, (issuer)(collection)(name)(price) )
FC_REFLECT( curio::protocol::nft_transfer_operation, (from)(token)(to) )
