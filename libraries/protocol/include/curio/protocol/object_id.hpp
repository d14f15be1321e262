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

#include <fc/variant.hpp>
#include <fc/reflect/typename.hpp>
#include <fc/string.hpp>

#include <cstdint>

namespace curio {
   namespace protocol {

      /**
       *  @brief Typed identifier of a ledger object
       *
       *  Instances are allocated sequentially per object type starting at 1.
       *  An instance of 0 never refers to an existing object.
       */
      template<uint8_t TypeID>
      struct object_id {
         static constexpr uint8_t type_id = TypeID;

         object_id() = default;
         explicit object_id(uint64_t i) : instance(i) {}

         uint64_t instance = 0;

         bool is_null() const { return instance == 0; }

         friend bool operator==(const object_id &a, const object_id &b) { return a.instance == b.instance; }
         friend bool operator!=(const object_id &a, const object_id &b) { return a.instance != b.instance; }
         friend bool operator<(const object_id &a, const object_id &b) { return a.instance < b.instance; }
         friend bool operator>(const object_id &a, const object_id &b) { return a.instance > b.instance; }
      };

   }
} // curio::protocol

namespace fc {
   template<uint8_t TypeID>
   void to_variant(const curio::protocol::object_id<TypeID> &var, fc::variant &vo, uint32_t max_depth = 1) {
      vo = fc::variant(var.instance, max_depth);
   }

   template<uint8_t TypeID>
   void from_variant(const fc::variant &var, curio::protocol::object_id<TypeID> &vo, uint32_t max_depth = 1) {
      vo.instance = var.as_uint64();
   }

   template<uint8_t TypeID>
   struct get_typename<curio::protocol::object_id<TypeID>> {
      static const char *name() {
         static std::string _str = std::string("curio::protocol::object_id<") + fc::to_string(uint64_t(TypeID)) + ">";
         return _str.c_str();
      }
   };
}
