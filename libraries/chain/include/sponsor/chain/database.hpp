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
#include <sponsor/chain/collaborators.hpp>
#include <sponsor/chain/demurrage.hpp>
#include <sponsor/chain/escrow_record_object.hpp>
#include <sponsor/chain/evaluator.hpp>
#include <sponsor/chain/reentrancy_guard.hpp>
#include <sponsor/chain/relationship_index.hpp>

#include <sponsor/protocol/ledger_parameters.hpp>
#include <sponsor/protocol/operations.hpp>

#include <sponsor/db/object_database.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

namespace sponsor { namespace chain {

   /**
    *   @class database
    *   @brief the invitation escrow ledger
    *
    *   Holds every escrow record together with the two relationship indexes that link inviters and
    *   invitees.  Operations are applied one at a time through push_operation(); each one runs in
    *   an undo session and is reverted as a whole when it fails.
    */
   class database : public db::object_database
   {
      public:
         database( identity_oracle& identity, value_mover& vault, const time_source& clock,
                   const decay_function& decay, const ledger_parameters& params );
         ~database();

         /**
          *  Validates and applies @p op.  Virtual operations are rejected.  On success the virtual
          *  operations generated while applying it are published through applied_operation.
          */
         operation_result push_operation( const operation& op );

         /**
          *  This signal is emitted for every virtual operation of a successfully applied operation,
          *  after all of its changes are in place and the ledger accepts calls again.  A listener that
          *  throws is logged and skipped.
          */
         fc::signal<void(const operation&)> applied_operation;

         /// @{ @group Read only queries
         vector<address>       list_inviters( const address& invitee )const;
         vector<address>       list_invitees( const address& inviter )const;
         /** returns a zero balance if there is no escrow for the pair */
         escrow_balance        get_escrowed_amount_and_days( const address& inviter, const address& invitee )const;

         const escrow_record_object* find_escrow( const address& inviter, const address& invitee )const;
         const escrow_record_object& get_escrow( const address& inviter, const address& invitee )const;

         /** current value of @p record */
         amount_type              settle( const escrow_record_object& record )const;
         day_index_type           today()const;
         const ledger_parameters& get_parameters()const { return _parameters; }
         identity_oracle&         identity()const { return _identity; }
         const decay_function&    decay()const { return _decay; }

         const relationship_index& invitees_of()const { return _invitees_of; }
         const relationship_index& inviters_of()const { return _inviters_of; }
         /// @}

         /// @{ @group Used by evaluators
         const escrow_record_object& create_escrow( const address& inviter, const address& invitee,
                                                    const amount_type& amount );
         /** destroys @p record and both of its index entries, returns its current value */
         amount_type remove_escrow( const escrow_record_object& record );

         /**
          *  Pays back the inviter's own token, at most as much as the ledger holds.
          *  @return the amount actually transferred
          */
         amount_type transfer_original( const address& to, const amount_type& amount );
         /**
          *  Pays the inviter in wrapped form, at most as much as the ledger holds.
          *  @return the amount actually converted
          */
         amount_type convert_and_transfer( const address& to, const amount_type& amount );

         void push_applied_operation( const operation& op );
         const vector<operation>& get_applied_operations()const { return _applied_ops; }
         /// @}

      private:
         void initialize_indexes();
         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

         operation_result apply_operation( const operation& op );
         amount_type      capped( const address& token_owner, const amount_type& amount )const;

         identity_oracle&               _identity;
         value_mover&                   _vault;
         const time_source&             _clock;
         const decay_function&          _decay;
         ledger_parameters              _parameters;

         relationship_index             _invitees_of;
         relationship_index             _inviters_of;
         reentrancy_guard               _gate;

         vector< unique_ptr<op_evaluator> > _operation_evaluators;
         vector<operation>              _applied_ops;
   };

} }
