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
#include <sponsor/hub/replay.hpp>
#include <sponsor/protocol/config.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <ostream>

namespace sponsor { namespace hub {

namespace {

amount_type step_amount( const replay_step& step )
{
   if( step.amount.valid() )
      return fc::variant( *step.amount ).as<amount_type>( 1 );
   FC_ASSERT( step.units.valid(), "Step '${a}' needs units or amount", ("a",step.action) );
   return amount_type( *step.units ) * SPONSOR_ASSET_PRECISION;
}

address step_counterpart( const replay_step& step )
{
   FC_ASSERT( step.counterpart.valid(), "Step '${a}' needs a counterpart", ("a",step.action) );
   return to_address( *step.counterpart );
}

}

address to_address( const string& name )
{
   if( address::is_valid( name ) )
      return address( name );
   return address::from_seed( name );
}

fc::variant_object replay_session::report( const address& who )const
{
   fc::mutable_variant_object result;
   result["avatar"]         = fc::variant( who, 1 );
   result["balance"]        = fc::variant( _hub.balance_of( who, who ), 1 );
   result["wrapped"]        = fc::variant( _hub.wrapped_balance_of( who, who ), 1 );
   result["held_by_ledger"] = fc::variant( _hub.balance_of( _ledger_account, who ), 1 );

   fc::variants invitees;
   for( const auto& invitee : _db.list_invitees( who ) )
   {
      fc::mutable_variant_object entry;
      entry["invitee"] = fc::variant( invitee, 1 );
      entry["escrow"]  = fc::variant( _db.get_escrowed_amount_and_days( who, invitee ), 2 );
      invitees.emplace_back( std::move( entry ) );
   }
   result["invitees"] = fc::variant( invitees );
   result["inviters"] = fc::variant( _db.list_inviters( who ), 2 );
   return result;
}

void replay_session::run_step( const replay_step& step )
{ try {
   const address actor = step.actor.empty() ? address() : to_address( step.actor );

   if( step.action == "register_human" )
   {
      optional<address> inviter;
      if( step.counterpart.valid() )
         inviter = to_address( *step.counterpart );
      _hub.register_human( actor, inviter );
   }
   else if( step.action == "register_organization" )
      _hub.register_organization( actor );
   else if( step.action == "issue" )
      _hub.issue( actor, step_amount( step ) );
   else if( step.action == "trust" )
   {
      fc::time_point_sec expiry = fc::time_point_sec::maximum();
      if( step.days.valid() )
         expiry = _hub.now() + *step.days * SPONSOR_SECONDS_PER_DAY;
      _hub.trust( actor, step_counterpart( step ), expiry );
   }
   else if( step.action == "untrust" )
      _hub.untrust( actor, step_counterpart( step ) );
   else if( step.action == "escrow" )
      _hub.safe_transfer_from( actor, actor, _ledger_account, actor, step_amount( step ),
                               encode_counterpart( step_counterpart( step ) ) );
   else if( step.action == "redeem" )
   {
      escrow_redeem_operation op;
      op.invitee = actor;
      op.inviter = step_counterpart( step );
      _db.push_operation( op );
   }
   else if( step.action == "revoke" )
   {
      escrow_revoke_operation op;
      op.inviter = actor;
      op.invitee = step_counterpart( step );
      _db.push_operation( op );
   }
   else if( step.action == "revoke_all" )
   {
      escrow_revoke_all_operation op;
      op.inviter = actor;
      _db.push_operation( op );
   }
   else if( step.action == "advance_days" )
   {
      FC_ASSERT( step.days.valid(), "advance_days needs days" );
      _hub.advance_days( *step.days );
   }
   else if( step.action == "show" )
      _out << fc::json::to_pretty_string( fc::variant( report( actor ) ) ) << "\n";
   else
      FC_THROW( "Unknown action ${a}", ("a",step.action) );
} FC_CAPTURE_AND_RETHROW( (step) ) }

uint32_t replay_session::run( const vector<replay_step>& steps )
{
   ilog( "Replaying ${n} steps", ("n",steps.size()) );
   uint32_t failed = 0;
   for( size_t i = 0; i < steps.size(); ++i )
   {
      try {
         run_step( steps[i] );
      } catch( const fc::exception& e ) {
         ++failed;
         elog( "Step ${i} (${a}) failed: ${e}", ("i",i)("a",steps[i].action)("e",e.to_string()) );
      }
   }
   ilog( "Replay finished, ${f} of ${n} steps failed", ("f",failed)("n",steps.size()) );
   return failed;
}

} } // sponsor::hub
