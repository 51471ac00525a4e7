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
#include <sponsor/chain/exceptions.hpp>

namespace sponsor { namespace chain {

   // Internal exceptions

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_validate_exception, chain_exception, 3040000,
                                   "operation validation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000,
                                   "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( reentrant_call, chain_exception, 3110000,
                                   "ledger entered again while an operation is in progress" )

   // Operation exceptions

   SPONSOR_IMPLEMENT_OP_BASE_EXCEPTIONS( escrow_invite )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( unauthorized_caller, escrow_invite, 1,
                                            "transfer notification did not come from the asset hub" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( ineligible_principal, escrow_invite, 2,
                                            "inviter is not an eligible principal" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( operator_mismatch, escrow_invite, 3,
                                            "operator, sender and token owner must be the same avatar" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( amount_out_of_range, escrow_invite, 4,
                                            "escrow amount out of range" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( malformed_payload, escrow_invite, 5,
                                            "transfer payload does not encode an invitee" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( counterpart_already_onboarded, escrow_invite, 6,
                                            "invitee is already registered" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( invalid_counterpart, escrow_invite, 7,
                                            "invitee address is not allowed" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( duplicate_relationship, escrow_invite, 8,
                                            "an escrow for this inviter and invitee already exists" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( trust_missing_or_expired, escrow_invite, 9,
                                            "inviter does not trust invitee" )

   SPONSOR_IMPLEMENT_OP_BASE_EXCEPTIONS( escrow_redeem )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( no_such_relationship, escrow_redeem, 1,
                                            "no active escrow from the chosen inviter" )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( trust_missing_or_expired, escrow_redeem, 2,
                                            "chosen inviter does not trust invitee" )

   SPONSOR_IMPLEMENT_OP_BASE_EXCEPTIONS( escrow_revoke )
   SPONSOR_IMPLEMENT_OP_EVALUATE_EXCEPTION( no_such_relationship, escrow_revoke, 1,
                                            "no active escrow for this invitee" )

   SPONSOR_IMPLEMENT_OP_BASE_EXCEPTIONS( escrow_revoke_all )

} } // sponsor::chain
