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

#include <fc/exception/exception.hpp>

#define CURIO_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                        \
      if( !(expr) )                                                \
         FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );      \
   FC_MULTILINE_MACRO_END

namespace curio {
   namespace protocol {

      FC_DECLARE_EXCEPTION( curio_exception, 4000000 )

      /// Malformed arguments: empty or oversized names, zero amounts, bids that are too low
      FC_DECLARE_DERIVED_EXCEPTION( invalid_input_exception,   curio_exception, 4010000 )
      /// Uniqueness or exclusivity violated: duplicate collection, listing or auction already active
      FC_DECLARE_DERIVED_EXCEPTION( conflict_exception,        curio_exception, 4020000 )
      /// Unknown collection or token
      FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,       curio_exception, 4030000 )
      /// Caller is not the required owner, seller or participant
      FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,    curio_exception, 4040000 )
      /// Operation not valid in the current listing or auction state
      FC_DECLARE_DERIVED_EXCEPTION( invalid_state_exception,   curio_exception, 4050000 )

   }
} // curio::protocol
