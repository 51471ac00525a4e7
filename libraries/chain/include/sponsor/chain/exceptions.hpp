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

#include <fc/exception/exception.hpp>
#include <sponsor/protocol/exceptions.hpp>
#include <sponsor/protocol/operations.hpp>
#include <sponsor/chain/types.hpp>

#define SPONSOR_DECLARE_OP_BASE_EXCEPTIONS( op_name )                 \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      sponsor::chain::operation_validate_exception,                   \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      sponsor::chain::operation_evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
      )

#define SPONSOR_IMPLEMENT_OP_BASE_EXCEPTIONS( op_name )               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _validate_exception,                                 \
      sponsor::chain::operation_validate_exception,                   \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _evaluate_exception,                                 \
      sponsor::chain::operation_evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      sponsor::chain::op_name ## _evaluate_exception,                 \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum                                                     \
      )

#define SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_IMPLEMENT_DERIVED_EXCEPTION(                                    \
      op_name ## _ ## exc_name,                                       \
      sponsor::chain::op_name ## _evaluate_exception,                 \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

#define SPONSOR_TRY_NOTIFY( signal, ... )                                     \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      wlog( "Caught exception in listener: ${e}", ("e", e.to_detail_string() ) ); \
   }                                                                          \
   catch( const std::exception& e )                                           \
   {                                                                          \
      wlog( "Caught unexpected exception in listener: ${e}", ("e", e.what()) ); \
   }

namespace sponsor { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception, chain_exception, 3040000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( reentrant_call,               chain_exception, 3110000 )

   SPONSOR_DECLARE_OP_BASE_EXCEPTIONS( escrow_invite );
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( unauthorized_caller, escrow_invite, 1 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( ineligible_principal, escrow_invite, 2 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( operator_mismatch, escrow_invite, 3 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( amount_out_of_range, escrow_invite, 4 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( malformed_payload, escrow_invite, 5 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( counterpart_already_onboarded, escrow_invite, 6 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( invalid_counterpart, escrow_invite, 7 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( duplicate_relationship, escrow_invite, 8 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( trust_missing_or_expired, escrow_invite, 9 )

   SPONSOR_DECLARE_OP_BASE_EXCEPTIONS( escrow_redeem );
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( no_such_relationship, escrow_redeem, 1 )
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( trust_missing_or_expired, escrow_redeem, 2 )

   SPONSOR_DECLARE_OP_BASE_EXCEPTIONS( escrow_revoke );
   SPONSOR_DECLARE_OP_EVALUATE_EXCEPTION( no_such_relationship, escrow_revoke, 1 )

   SPONSOR_DECLARE_OP_BASE_EXCEPTIONS( escrow_revoke_all );

} } // sponsor::chain
