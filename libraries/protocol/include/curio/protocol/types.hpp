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

#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <curio/protocol/config.hpp>
#include <curio/protocol/object_id.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace curio {
   namespace protocol {
      using std::string;
      using std::vector;
      using fc::optional;
      using fc::time_point_sec;

      typedef fc::safe<int64_t> share_type;

      /// Identity of a caller, owner or counterparty
      typedef string account_name_type;

      enum object_type {
         null_object_type,
         collection_object_type,
         nft_object_type,
         listing_object_type,
         auction_object_type,
         account_object_type,
         pending_credit_object_type,
         global_property_object_type,
         OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
      };

      typedef object_id<collection_object_type> collection_id_type;
      typedef object_id<nft_object_type>        nft_id_type;

      struct void_result {
      };

      bool is_valid_account_name(const account_name_type &name);
   }
} // curio::protocol

FC_REFLECT_ENUM( curio::protocol::object_type,
                 (null_object_type)
                 (collection_object_type)
                 (nft_object_type)
                 (listing_object_type)
                 (auction_object_type)
                 (account_object_type)
                 (pending_credit_object_type)
                 (global_property_object_type)
                 (OBJECT_TYPE_COUNT)
               )

FC_REFLECT_EMPTY( curio::protocol::void_result )
