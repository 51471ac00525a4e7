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
#include <sponsor/hub/memory_hub.hpp>
#include <sponsor/hub/ledger_receiver.hpp>

#include <fc/log/logger.hpp>

namespace sponsor { namespace hub {

void account_vault::transfer_original( const address& to, const amount_type& amount )
{
   _hub.safe_transfer_from( _account, _account, to, to, amount );
}

void account_vault::convert_and_transfer( const address& to, const amount_type& amount )
{
   _hub.wrap( _account, to, amount );
   _hub.transfer_wrapped( _account, to, to, amount );
}

amount_type account_vault::held_balance( const address& token_owner )const
{
   return _hub.balance_of( _account, token_owner );
}

memory_hub::memory_hub( const decay_function& decay, fc::time_point_sec day_zero, const address& self )
   : _decay( decay ), _self( self ), _day_zero( day_zero ), _now( day_zero )
{
   FC_ASSERT( !_self.is_null() && !_self.is_sentinel(), "The hub needs a regular address" );
}

memory_hub::~memory_hub(){}

void memory_hub::register_human( const address& avatar, const optional<address>& inviter )
{ try {
   FC_ASSERT( !avatar.is_null() && !avatar.is_sentinel(), "Cannot register a reserved address" );
   FC_ASSERT( _avatars.find( avatar ) == _avatars.end(), "Avatar is already registered" );
   if( inviter.valid() )
   {
      FC_ASSERT( is_eligible_principal( *inviter ), "Inviter must be a registered human" );
      FC_ASSERT( trusts( *inviter, avatar ), "Inviter must trust the invited avatar" );
      const amount_type cost = amount_type( SPONSOR_INVITATION_COST_UNITS ) * SPONSOR_ASSET_PRECISION;
      burn( *inviter, *inviter, cost );
   }
   _avatars[avatar] = human_avatar;
   ilog( "Registered human ${a}", ("a",avatar)("inviter",inviter) );
} FC_CAPTURE_AND_RETHROW( (avatar)(inviter) ) }

void memory_hub::register_organization( const address& organization )
{ try {
   FC_ASSERT( !organization.is_null() && !organization.is_sentinel(), "Cannot register a reserved address" );
   FC_ASSERT( _avatars.find( organization ) == _avatars.end(), "Avatar is already registered" );
   _avatars[organization] = organization_avatar;
   ilog( "Registered organization ${a}", ("a",organization) );
} FC_CAPTURE_AND_RETHROW( (organization) ) }

optional<avatar_kind> memory_hub::find_avatar( const address& a )const
{
   auto itr = _avatars.find( a );
   if( itr == _avatars.end() )
      return optional<avatar_kind>();
   return itr->second;
}

bool memory_hub::is_eligible_principal( const address& a )const
{
   auto kind = find_avatar( a );
   return kind.valid() && *kind == human_avatar;
}

bool memory_hub::is_onboarded( const address& a )const
{
   return find_avatar( a ).valid();
}

void memory_hub::trust( const address& truster, const address& trustee, fc::time_point_sec expiry )
{
   FC_ASSERT( truster != trustee, "Avatars trust themselves implicitly" );
   _trust[ std::make_pair( truster, trustee ) ] = expiry;
}

void memory_hub::untrust( const address& truster, const address& trustee )
{
   _trust.erase( std::make_pair( truster, trustee ) );
}

bool memory_hub::trusts( const address& truster, const address& trustee )const
{
   auto itr = _trust.find( std::make_pair( truster, trustee ) );
   return itr != _trust.end() && itr->second > _now;
}

amount_type memory_hub::current( const balance_map& balances, const address& holder, const address& token_id )const
{
   auto itr = balances.find( std::make_pair( holder, token_id ) );
   if( itr == balances.end() )
      return amount_type( 0 );
   const day_index_type day = today();
   const day_index_type days = day > itr->second.anchor_day ? day - itr->second.anchor_day : 0;
   return _decay.project( itr->second.amount, days );
}

void memory_hub::set_current( balance_map& balances, const address& holder, const address& token_id,
                              const amount_type& amount )
{
   const auto key = std::make_pair( holder, token_id );
   if( amount == 0 )
   {
      balances.erase( key );
      return;
   }
   balance_entry& entry = balances[key];
   entry.amount     = amount;
   entry.anchor_day = today();
}

void memory_hub::debit( balance_map& balances, const address& holder, const address& token_id,
                        const amount_type& amount )
{
   const amount_type available = current( balances, holder, token_id );
   FC_ASSERT( available >= amount, "Insufficient balance: ${holder} holds ${available} of ${token}, needs ${amount}",
              ("holder",holder)("available",available)("token",token_id)("amount",amount) );
   set_current( balances, holder, token_id, available - amount );
}

void memory_hub::credit( balance_map& balances, const address& holder, const address& token_id,
                         const amount_type& amount )
{
   set_current( balances, holder, token_id, current( balances, holder, token_id ) + amount );
}

void memory_hub::issue( const address& avatar, const amount_type& amount )
{ try {
   FC_ASSERT( is_onboarded( avatar ), "Only registered avatars issue tokens" );
   credit( _balances, avatar, avatar, amount );
} FC_CAPTURE_AND_RETHROW( (avatar)(amount) ) }

amount_type memory_hub::balance_of( const address& holder, const address& token_id )const
{
   return current( _balances, holder, token_id );
}

amount_type memory_hub::wrapped_balance_of( const address& holder, const address& token_id )const
{
   return current( _wrapped, holder, token_id );
}

void memory_hub::safe_transfer_from( const address& operator_account, const address& from, const address& to,
                                     const address& token_id, const amount_type& amount,
                                     const vector<char>& payload )
{ try {
   FC_ASSERT( !to.is_null(), "Cannot transfer to the null address" );

   const balance_map before = _balances;
   debit( _balances, from, token_id, amount );
   credit( _balances, to, token_id, amount );
   dlog( "Moved ${amount} of ${token} from ${from} to ${to}",
         ("amount",amount)("token",token_id)("from",from)("to",to) );

   auto itr = _receivers.find( to );
   if( itr == _receivers.end() || itr->second == nullptr )
      return;
   try {
      itr->second->on_received( _self, operator_account, from, token_id, amount, payload );
   } catch( const fc::exception& e ) {
      _balances = before;
      dlog( "Receiver ${to} rejected the transfer: ${e}", ("to",to)("e",e.to_string()) );
      throw;
   }
} FC_CAPTURE_AND_RETHROW( (operator_account)(from)(to)(token_id)(amount) ) }

void memory_hub::wrap( const address& holder, const address& token_id, const amount_type& amount )
{ try {
   debit( _balances, holder, token_id, amount );
   credit( _wrapped, holder, token_id, amount );
} FC_CAPTURE_AND_RETHROW( (holder)(token_id)(amount) ) }

void memory_hub::transfer_wrapped( const address& from, const address& to, const address& token_id,
                                   const amount_type& amount )
{ try {
   debit( _wrapped, from, token_id, amount );
   credit( _wrapped, to, token_id, amount );
} FC_CAPTURE_AND_RETHROW( (from)(to)(token_id)(amount) ) }

void memory_hub::burn( const address& holder, const address& token_id, const amount_type& amount )
{ try {
   debit( _balances, holder, token_id, amount );
} FC_CAPTURE_AND_RETHROW( (holder)(token_id)(amount) ) }

void memory_hub::set_receiver( const address& account, transfer_receiver* receiver )
{
   if( receiver == nullptr )
      _receivers.erase( account );
   else
      _receivers[account] = receiver;
}

void memory_hub::attach_ledger( const address& account, chain::database& db )
{
   std::unique_ptr<transfer_receiver> receiver( new ledger_receiver( db ) );
   _receivers[account] = receiver.get();
   _owned_receivers[account] = std::move( receiver );
}

account_vault& memory_hub::vault( const address& account )
{
   auto& slot = _vaults[account];
   if( !slot )
      slot.reset( new account_vault( *this, account ) );
   return *slot;
}

void memory_hub::advance( uint32_t seconds )
{
   _now += seconds;
}

void memory_hub::advance_days( uint32_t days )
{
   advance( days * SPONSOR_SECONDS_PER_DAY );
}

day_index_type memory_hub::today()const
{
   return ( _now.sec_since_epoch() - _day_zero.sec_since_epoch() ) / SPONSOR_SECONDS_PER_DAY;
}

} } // sponsor::hub
