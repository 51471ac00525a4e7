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
#include <sponsor/protocol/object_id.hpp>

#include <fc/variant.hpp>

#include <boost/lexical_cast.hpp>

namespace fc
{
   void to_variant( const sponsor::db::object_id_type& var,  fc::variant& vo, uint32_t max_depth )
   {
      vo = std::string( var );
   }

   void from_variant( const fc::variant& var,  sponsor::db::object_id_type& vo, uint32_t max_depth )
   { try {
      const auto s = var.get_string();
      const auto first_dot = s.find( '.' );
      FC_ASSERT( first_dot != std::string::npos && first_dot != 0, "Malformed object id ${s}", ("s",s) );
      const auto type = boost::lexical_cast<uint64_t>( s.substr( 0, first_dot ) );
      FC_ASSERT( type <= 0xff, "Object type ${t} out of range", ("t",type) );
      vo.reset( uint8_t(type), boost::lexical_cast<uint64_t>( s.substr( first_dot + 1 ) ) );
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
