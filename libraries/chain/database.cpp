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
#include <sponsor/chain/invitation_evaluator.hpp>

namespace sponsor { namespace chain {

database::database( identity_oracle& identity, value_mover& vault, const time_source& clock,
                    const decay_function& decay, const ledger_parameters& params )
   : _identity( identity ),
     _vault( vault ),
     _clock( clock ),
     _decay( decay ),
     _parameters( params ),
     _invitees_of( *this, invitees_of_inviter ),
     _inviters_of( *this, inviters_of_invitee )
{ try {
   _parameters.validate();
   initialize_indexes();
   initialize_evaluators();
} FC_CAPTURE_AND_RETHROW( (params) ) }

database::~database()
{
   applied_operation.disconnect_all_slots();
}

void database::initialize_indexes()
{
   add_index< escrow_record_index >();
   add_index< relationship_link_index >();
}

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<escrow_invite_evaluator>();
   register_evaluator<escrow_redeem_evaluator>();
   register_evaluator<escrow_revoke_evaluator>();
   register_evaluator<escrow_revoke_all_evaluator>();
}

operation_result database::push_operation( const operation& op )
{ try {
   operation_result result;
   vector<operation> notifications;
   {
      reentrancy_guard::scope gate( _gate );

      operation_validate( op );
      FC_ASSERT( !is_virtual_operation( op ), "Virtual operations cannot be pushed" );

      _applied_ops.clear();
      try {
         auto session = _undo_db.start_undo_session();
         result = apply_operation( op );
         session.commit();
      } catch( const fc::exception& e ) {
         wlog( "Operation failed: ${e}", ("e", e.to_string()) );
         _applied_ops.clear();
         throw;
      }
      notifications = std::move( _applied_ops );
      _applied_ops.clear();
   }

   // the operation is committed; listeners may push further operations and cannot undo it
   for( const auto& vop : notifications )
   {
      SPONSOR_TRY_NOTIFY( applied_operation, vop )
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result database::apply_operation( const operation& op )
{ try {
   const auto which = op.which();
   FC_ASSERT( which >= 0 && uint64_t(which) < _operation_evaluators.size(), "Unknown operation ${w}", ("w",which) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );
   dlog( "Applying ${op}", ("op",op) );
   return eval->evaluate( *this, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::push_applied_operation( const operation& op )
{
   _applied_ops.push_back( op );
}

} }
