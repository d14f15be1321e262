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
#include <curio/protocol/exceptions.hpp>

namespace curio {
   namespace protocol {

      FC_IMPLEMENT_EXCEPTION( curio_exception, 4000000, "curio exception" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_input_exception,   curio_exception, 4010000, "invalid input" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( conflict_exception,        curio_exception, 4020000, "conflict" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( not_found_exception,       curio_exception, 4030000, "not found" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,    curio_exception, 4040000, "unauthorized" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_state_exception,   curio_exception, 4050000, "invalid state" )

   }
} // curio::protocol
