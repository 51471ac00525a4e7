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

#include <sponsor/protocol/types.hpp>
#include <sponsor/protocol/address.hpp>

namespace sponsor { namespace protocol {

   /**
    *  @defgroup operations Ledger Operations
    *  @brief A set of valid operations on the escrow ledger
    *
    *  Every operation is a struct with public members, reflected with FC_REFLECT so that it can be
    *  logged and read from JSON.  Operations are submitted to the ledger, which checks and applies them
    *  atomically: either every effect of an operation is visible afterwards or none is.
    *
    *  Some operations are "virtual": the ledger generates them while applying a submitted operation to
    *  notify observers about the relationships that were created or settled.  Virtual operations are
    *  never accepted from outside.
    *
    *  @{
    */

   struct void_result{};
   typedef fc::static_variant<void_result,object_id_type> operation_result;

   struct base_operation
   {
      /** checks that do not depend on ledger state */
      void validate()const{}
   };

   /**
    * Shared shape of the notifications the ledger emits about one (inviter, invitee) relationship.
    */
   struct base_invite_notification : public base_operation
   {
      base_invite_notification(){}
      base_invite_notification( const address& inviter, const address& invitee, const amount_type& amount )
         : inviter(inviter), invitee(invitee), amount(amount) {}

      void validate()const { FC_ASSERT( !"virtual operation" ); }

      address     inviter;
      address     invitee;
      amount_type amount;
   };

   ///@}

} } // sponsor::protocol

FC_REFLECT( sponsor::protocol::void_result, )
FC_REFLECT_TYPENAME( sponsor::protocol::operation_result )
FC_REFLECT( sponsor::protocol::base_invite_notification, (inviter)(invitee)(amount) )
