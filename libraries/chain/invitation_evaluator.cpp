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
#include <sponsor/chain/exceptions.hpp>
#include <sponsor/chain/invitation_evaluator.hpp>

namespace sponsor { namespace chain {

void_result escrow_invite_evaluator::do_evaluate( const escrow_invite_operation& o )
{ try {
   const database& d = db();
   const ledger_parameters& params = d.get_parameters();

   SPONSOR_ASSERT( o.hub == params.asset_hub, escrow_invite_unauthorized_caller,
                   "Transfer notifications are only accepted from ${hub}", ("hub",params.asset_hub)("caller",o.hub) );
   SPONSOR_ASSERT( d.identity().is_eligible_principal( o.from ), escrow_invite_ineligible_principal,
                   "${from} may not invite", ("from",o.from) );
   SPONSOR_ASSERT( o.operator_account == o.from && o.token_id == o.from, escrow_invite_operator_mismatch,
                   "Only ${from} may escrow its own token", ("from",o.from)("operator",o.operator_account)("token",o.token_id) );
   SPONSOR_ASSERT( o.amount >= params.min_escrow_amount && o.amount <= params.max_escrow_amount,
                   escrow_invite_amount_out_of_range,
                   "Escrow amount ${amount} is outside [${min}, ${max}]",
                   ("amount",o.amount)("min",params.min_escrow_amount)("max",params.max_escrow_amount) );

   const optional<address> invitee = decode_counterpart( o.payload );
   SPONSOR_ASSERT( invitee.valid(), escrow_invite_malformed_payload,
                   "Payload of ${size} bytes does not hold an address", ("size",o.payload.size()) );
   _invitee = *invitee;

   SPONSOR_ASSERT( !d.identity().is_onboarded( _invitee ), escrow_invite_counterpart_already_onboarded,
                   "${invitee} is already registered", ("invitee",_invitee) );
   SPONSOR_ASSERT( !_invitee.is_null() && !_invitee.is_sentinel(), escrow_invite_invalid_counterpart,
                   "${invitee} cannot be invited", ("invitee",_invitee) );
   SPONSOR_ASSERT( d.find_escrow( o.from, _invitee ) == nullptr, escrow_invite_duplicate_relationship,
                   "${inviter} already escrowed for ${invitee}", ("inviter",o.from)("invitee",_invitee) );
   SPONSOR_ASSERT( d.identity().trusts( o.from, _invitee ), escrow_invite_trust_missing_or_expired,
                   "${inviter} does not trust ${invitee}", ("inviter",o.from)("invitee",_invitee) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type escrow_invite_evaluator::do_apply( const escrow_invite_operation& o )
{ try {
   database& d = db();
   const auto& record = d.create_escrow( o.from, _invitee, o.amount );
   d.push_applied_operation( invite_escrowed_operation( o.from, _invitee, o.amount ) );
   ilog( "${inviter} escrowed ${amount} for ${invitee}", ("inviter",o.from)("invitee",_invitee)("amount",o.amount) );
   return record.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_redeem_evaluator::do_evaluate( const escrow_redeem_operation& o )
{ try {
   const database& d = db();
   const escrow_record_object* record = d.find_escrow( o.inviter, o.invitee );
   SPONSOR_ASSERT( record != nullptr && d.settle( *record ) > 0, escrow_redeem_no_such_relationship,
                   "${invitee} holds no escrow from ${inviter}", ("inviter",o.inviter)("invitee",o.invitee) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_redeem_evaluator::do_apply( const escrow_redeem_operation& o )
{ try {
   database& d = db();

   // settle every escrow of the invitee before any tokens move
   vector< pair<address, amount_type> > settlements;
   for( const address& inviter : d.list_inviters( o.invitee ) )
   {
      const amount_type settled = d.remove_escrow( d.get_escrow( inviter, o.invitee ) );
      if( inviter == o.inviter )
         SPONSOR_ASSERT( d.identity().trusts( inviter, o.invitee ), escrow_redeem_trust_missing_or_expired,
                         "${inviter} no longer trusts ${invitee}", ("inviter",inviter)("invitee",o.invitee) );
      settlements.emplace_back( inviter, settled );
   }

   // the chosen inviter's receiver may run arbitrary code, so it is paid before any refund;
   // refunds are capped by the held balance and cannot fail
   for( const auto& settlement : settlements )
      if( settlement.first == o.inviter )
         d.transfer_original( settlement.first, settlement.second );

   for( const auto& settlement : settlements )
   {
      const address& inviter = settlement.first;
      const amount_type& settled = settlement.second;
      if( inviter == o.inviter )
         d.push_applied_operation( invite_redeemed_operation( inviter, o.invitee, settled ) );
      else
      {
         d.convert_and_transfer( inviter, settled );
         d.push_applied_operation( invite_refunded_operation( inviter, o.invitee, settled ) );
      }
   }
   ilog( "${invitee} redeemed the invitation of ${inviter}", ("inviter",o.inviter)("invitee",o.invitee) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_revoke_evaluator::do_evaluate( const escrow_revoke_operation& o )
{ try {
   const database& d = db();
   _record = d.find_escrow( o.inviter, o.invitee );
   SPONSOR_ASSERT( _record != nullptr && d.settle( *_record ) > 0, escrow_revoke_no_such_relationship,
                   "${inviter} holds no escrow for ${invitee}", ("inviter",o.inviter)("invitee",o.invitee) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_revoke_evaluator::do_apply( const escrow_revoke_operation& o )
{ try {
   database& d = db();
   const amount_type settled = d.remove_escrow( *_record );
   d.convert_and_transfer( o.inviter, settled );
   d.push_applied_operation( invite_revoked_operation( o.inviter, o.invitee, settled ) );
   ilog( "${inviter} revoked the invitation of ${invitee}", ("inviter",o.inviter)("invitee",o.invitee) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_revoke_all_evaluator::do_evaluate( const escrow_revoke_all_operation& o )
{
   return void_result();
}

void_result escrow_revoke_all_evaluator::do_apply( const escrow_revoke_all_operation& o )
{ try {
   database& d = db();
   const vector<address> invitees = d.list_invitees( o.inviter );
   if( invitees.empty() )
      return void_result();

   amount_type total = 0;
   for( const address& invitee : invitees )
   {
      const amount_type settled = d.remove_escrow( d.get_escrow( o.inviter, invitee ) );
      total += settled;
      d.push_applied_operation( invite_revoked_operation( o.inviter, invitee, settled ) );
   }
   d.convert_and_transfer( o.inviter, total );
   ilog( "${inviter} revoked ${n} invitations", ("inviter",o.inviter)("n",invitees.size()) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // sponsor::chain
