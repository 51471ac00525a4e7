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

day_index_type database::today()const
{
   return _clock.today();
}

vector<address> database::list_inviters( const address& invitee )const
{
   return _inviters_of.enumerate( invitee );
}

vector<address> database::list_invitees( const address& inviter )const
{
   return _invitees_of.enumerate( inviter );
}

const escrow_record_object* database::find_escrow( const address& inviter, const address& invitee )const
{
   const auto& records = get_index_type<escrow_record_index>().indices().get<by_pair>();
   auto itr = records.find( boost::make_tuple( inviter, invitee ) );
   if( itr == records.end() )
      return nullptr;
   return &*itr;
}

const escrow_record_object& database::get_escrow( const address& inviter, const address& invitee )const
{
   const escrow_record_object* record = find_escrow( inviter, invitee );
   FC_ASSERT( record != nullptr, "No escrow from ${inviter} for ${invitee}", ("inviter",inviter)("invitee",invitee) );
   return *record;
}

amount_type database::settle( const escrow_record_object& record )const
{
   const day_index_type now = today();
   const day_index_type days = now > record.last_updated_day ? now - record.last_updated_day : 0;
   return _decay.project( record.face_value, days );
}

escrow_balance database::get_escrowed_amount_and_days( const address& inviter, const address& invitee )const
{
   escrow_balance result;
   const escrow_record_object* record = find_escrow( inviter, invitee );
   if( record == nullptr )
      return result;
   const day_index_type now = today();
   result.days   = now > record->last_updated_day ? now - record->last_updated_day : 0;
   result.amount = _decay.project( record->face_value, result.days );
   return result;
}

} }
