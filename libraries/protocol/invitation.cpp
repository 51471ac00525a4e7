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
#include <sponsor/protocol/invitation.hpp>

#include <algorithm>
#include <cstring>

namespace sponsor { namespace protocol {

   void escrow_redeem_operation::validate()const
   {
      FC_ASSERT( !invitee.is_null() && !invitee.is_sentinel(), "Invitee must be a regular address" );
   }

   void escrow_revoke_operation::validate()const
   {
      FC_ASSERT( !inviter.is_null() && !inviter.is_sentinel(), "Inviter must be a regular address" );
   }

   void escrow_revoke_all_operation::validate()const
   {
      FC_ASSERT( !inviter.is_null() && !inviter.is_sentinel(), "Inviter must be a regular address" );
   }

   std::vector<char> encode_counterpart( const address& invitee )
   {
      std::vector<char> payload( SPONSOR_COUNTERPART_PAYLOAD_SIZE, 0 );
      std::memcpy( payload.data() + SPONSOR_COUNTERPART_PAYLOAD_SIZE - SPONSOR_ADDRESS_SIZE,
                   invitee.addr.data(), SPONSOR_ADDRESS_SIZE );
      return payload;
   }

   optional<address> decode_counterpart( const std::vector<char>& payload )
   {
      if( payload.size() != SPONSOR_COUNTERPART_PAYLOAD_SIZE )
         return optional<address>();
      const auto padding_end = payload.begin() + ( SPONSOR_COUNTERPART_PAYLOAD_SIZE - SPONSOR_ADDRESS_SIZE );
      if( std::any_of( payload.begin(), padding_end, []( char c ){ return c != 0; } ) )
         return optional<address>();
      address result;
      std::memcpy( result.addr.data(), &*padding_end, SPONSOR_ADDRESS_SIZE );
      return result;
   }

} } // sponsor::protocol
