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
#include <sponsor/protocol/address.hpp>
#include <sponsor/protocol/exceptions.hpp>

#include <fc/variant.hpp>

#include <algorithm>
#include <cctype>

namespace sponsor { namespace protocol {

   address::address( const std::string& hex_str )
   {
      SPONSOR_ASSERT( is_valid( hex_str ), invalid_address_exception,
                      "'${a}' is not a valid address", ("a",hex_str) );
      addr = fc::ripemd160( hex_str.substr( sizeof(SPONSOR_ADDRESS_PREFIX) - 1 ) );
   }

   address address::from_seed( const std::string& seed )
   {
      return address( fc::ripemd160::hash( seed ) );
   }

   address address::sentinel()
   {
      address result;
      result.addr.data()[SPONSOR_ADDRESS_SIZE - 1] = 1;
      return result;
   }

   bool address::is_valid( const std::string& hex_str )
   {
      const std::string prefix( SPONSOR_ADDRESS_PREFIX );
      if( hex_str.size() != prefix.size() + 2 * SPONSOR_ADDRESS_SIZE )
         return false;
      if( hex_str.compare( 0, prefix.size(), prefix ) != 0 )
         return false;
      return std::all_of( hex_str.begin() + prefix.size(), hex_str.end(),
                          []( char c ){ return std::isxdigit( (unsigned char)c ) != 0; } );
   }

   bool address::is_null()const
   {
      return addr == fc::ripemd160();
   }

   bool address::is_sentinel()const
   {
      return *this == sentinel();
   }

   address::operator std::string()const
   {
      return SPONSOR_ADDRESS_PREFIX + addr.str();
   }

} } // namespace sponsor::protocol

namespace fc
{
    void to_variant( const sponsor::protocol::address& var,  variant& vo, uint32_t max_depth )
    {
        vo = std::string(var);
    }
    void from_variant( const variant& var,  sponsor::protocol::address& vo, uint32_t max_depth )
    {
        vo = sponsor::protocol::address( var.as_string() );
    }
}
