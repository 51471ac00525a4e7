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
#include <sponsor/protocol/types.hpp>

#include <fc/variant.hpp>

#include <algorithm>
#include <cctype>

namespace fc
{
   void to_variant( const sponsor::protocol::amount_type& var,  fc::variant& vo, uint32_t max_depth )
   {
      vo = var.str();
   }

   void from_variant( const fc::variant& var,  sponsor::protocol::amount_type& vo, uint32_t max_depth )
   { try {
      if( var.is_uint64() || var.is_int64() )
      {
         FC_ASSERT( !var.is_int64() || var.as_int64() >= 0, "Amounts cannot be negative" );
         vo = sponsor::protocol::amount_type( var.as_uint64() );
         return;
      }
      const auto s = var.get_string();
      FC_ASSERT( !s.empty() && s.size() <= 58, "Malformed amount ${s}", ("s",s) );
      FC_ASSERT( std::all_of( s.begin(), s.end(), []( char c ){ return std::isdigit( (unsigned char)c ) != 0; } ),
                 "Amounts must be decimal digits only, got ${s}", ("s",s) );
      vo = sponsor::protocol::amount_type( s.c_str() );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
