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

#include <sponsor/protocol/types.hpp>

#include <fc/crypto/ripemd160.hpp>

namespace sponsor { namespace protocol {

   /**
    *  @brief a 160 bit account identifier
    *
    *  Addresses are written as SPONSOR_ADDRESS_PREFIX followed by 40 lower case hex digits.  Two values
    *  are reserved: the null address (all zeros) and the sentinel (0x...01) which terminates
    *  relationship lists and therefore can never own or be linked as a counterpart.
    */
   class address
   {
      public:
       address(){} ///< constructs the null address
       explicit address( const std::string& hex_str ); ///< parses prefix + 40 hex digits
       explicit address( const fc::ripemd160& a ):addr(a){}

       /** derives a stable address from a human readable seed, used for named actors */
       static address from_seed( const std::string& seed );
       static address sentinel();

       static bool is_valid( const std::string& hex_str );

       bool is_null()const;
       bool is_sentinel()const;

       explicit operator std::string()const; ///< converts to prefixed hex

       fc::ripemd160 addr;
   };
   inline bool operator == ( const address& a, const address& b ) { return a.addr == b.addr; }
   inline bool operator != ( const address& a, const address& b ) { return a.addr != b.addr; }
   inline bool operator <  ( const address& a, const address& b ) { return a.addr <  b.addr; }

} } // namespace sponsor::protocol

namespace fc
{
   void to_variant( const sponsor::protocol::address& var,  fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var,  sponsor::protocol::address& vo, uint32_t max_depth = 1 );
}

FC_REFLECT( sponsor::protocol::address, (addr) )
