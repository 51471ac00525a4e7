/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
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
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <map>
#include <memory>
#include <set>
#include <unordered_map>
#include <vector>
#include <string>
#include <deque>
#include <cstdint>

#include <sponsor/protocol/config.hpp>
#include <sponsor/protocol/object_id.hpp>

namespace sponsor { namespace protocol {
   using namespace sponsor::db;

   using std::map;
   using std::vector;
   using std::unordered_map;
   using std::string;
   using std::deque;
   using std::shared_ptr;
   using std::weak_ptr;
   using std::unique_ptr;
   using std::set;
   using std::pair;
   using std::make_pair;

   using fc::variant_object;
   using fc::variant;
   using fc::optional;
   using fc::static_variant;
   using fc::time_point_sec;

   /**
    *  Token amounts carry 18 decimals and are stored with 192 bits of precision.  Arithmetic
    *  wraps silently, every producer of an amount is bounded far below 2^192.
    */
   typedef boost::multiprecision::number<
      boost::multiprecision::cpp_int_backend< 192, 192, boost::multiprecision::unsigned_magnitude,
                                              boost::multiprecision::unchecked, void > > amount_type;

   /** Absolute day number counted from the hub's day zero */
   typedef uint64_t day_index_type;

} } // sponsor::protocol

namespace fc
{
   void to_variant( const sponsor::protocol::amount_type& var,  fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var,  sponsor::protocol::amount_type& vo, uint32_t max_depth = 1 );
}

FC_REFLECT_TYPENAME( sponsor::protocol::amount_type )
