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
#include <sponsor/chain/database.hpp>

namespace sponsor { namespace chain {

const escrow_record_object& database::create_escrow( const address& inviter, const address& invitee,
                                                     const amount_type& amount )
{
   FC_ASSERT( amount > 0, "Escrow records hold a positive face value" );
   const auto& record = create<escrow_record_object>( [&]( escrow_record_object& r ) {
      r.inviter          = inviter;
      r.invitee          = invitee;
      r.face_value       = amount;
      r.last_updated_day = today();
   });
   _invitees_of.insert( inviter, invitee );
   _inviters_of.insert( invitee, inviter );
   return record;
}

amount_type database::remove_escrow( const escrow_record_object& record )
{
   const amount_type settled = settle( record );
   const address inviter = record.inviter;
   const address invitee = record.invitee;
   remove( record );
   _invitees_of.remove( inviter, invitee );
   _inviters_of.remove( invitee, inviter );
   return settled;
}

amount_type database::capped( const address& token_owner, const amount_type& amount )const
{
   const amount_type held = _vault.held_balance( token_owner );
   if( held < amount )
   {
      wlog( "Ledger holds ${held} of ${token}, capping transfer of ${amount}",
            ("held",held)("token",token_owner)("amount",amount) );
      return held;
   }
   return amount;
}

amount_type database::transfer_original( const address& to, const amount_type& amount )
{
   const amount_type value = capped( to, amount );
   if( value == 0 )
      return value;
   dlog( "Returning ${v} to ${to}", ("v",value)("to",to) );
   _vault.transfer_original( to, value );
   return value;
}

amount_type database::convert_and_transfer( const address& to, const amount_type& amount )
{
   const amount_type value = capped( to, amount );
   if( value == 0 )
      return value;
   dlog( "Refunding ${v} wrapped to ${to}", ("v",value)("to",to) );
   _vault.convert_and_transfer( to, value );
   return value;
}

} }
