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

#include <sponsor/protocol/base.hpp>

namespace sponsor { namespace protocol {

   /**
    *  @brief lock part of the inviter's personal token for an invitee who is not registered yet
    *  @ingroup operations
    *
    *  Built from the notification the asset hub delivers when tokens are transferred to the
    *  ledger's account.  The payload carries the invitee encoded with encode_counterpart().
    */
   struct escrow_invite_operation : public base_operation
   {
      /// component that delivered the transfer notification
      address           hub;
      /// account that initiated the transfer
      address           operator_account;
      /// account the tokens came from, the inviter
      address           from;
      /// personal token being transferred, identified by the avatar that issues it
      address           token_id;
      amount_type       amount;
      std::vector<char> payload;
   };

   /**
    *  @brief accept one pending invitation
    *  @ingroup operations
    *
    *  Settles every escrow currently held for the invitee: the chosen inviter receives the
    *  decayed amount back in its original form, every other inviter is refunded in the wrapped form.
    */
   struct escrow_redeem_operation : public base_operation
   {
      address invitee;
      address inviter;

      void validate()const;
   };

   /**
    *  @brief withdraw one invitation
    *  @ingroup operations
    */
   struct escrow_revoke_operation : public base_operation
   {
      address inviter;
      address invitee;

      void validate()const;
   };

   /**
    *  @brief withdraw every open invitation of an inviter with a single refund
    *  @ingroup operations
    */
   struct escrow_revoke_all_operation : public base_operation
   {
      address inviter;

      void validate()const;
   };

   /** virtual op emitted when an escrow is created */
   struct invite_escrowed_operation : public base_invite_notification
   {
      using base_invite_notification::base_invite_notification;
      invite_escrowed_operation(){}
   };

   /** virtual op emitted when the chosen inviter of a redemption is paid back */
   struct invite_redeemed_operation : public base_invite_notification
   {
      using base_invite_notification::base_invite_notification;
      invite_redeemed_operation(){}
   };

   /** virtual op emitted when a redemption refunds an inviter that was not chosen */
   struct invite_refunded_operation : public base_invite_notification
   {
      using base_invite_notification::base_invite_notification;
      invite_refunded_operation(){}
   };

   /** virtual op emitted for every escrow an inviter withdraws */
   struct invite_revoked_operation : public base_invite_notification
   {
      using base_invite_notification::base_invite_notification;
      invite_revoked_operation(){}
   };

   /** Encodes an invitee as the single 32 byte word expected in escrow_invite_operation::payload */
   std::vector<char> encode_counterpart( const address& invitee );

   /** Returns an invalid optional unless @p payload is exactly one zero padded address word */
   optional<address> decode_counterpart( const std::vector<char>& payload );

} } // sponsor::protocol

FC_REFLECT( sponsor::protocol::escrow_invite_operation, (hub)(operator_account)(from)(token_id)(amount)(payload) )
FC_REFLECT( sponsor::protocol::escrow_redeem_operation, (invitee)(inviter) )
FC_REFLECT( sponsor::protocol::escrow_revoke_operation, (inviter)(invitee) )
FC_REFLECT( sponsor::protocol::escrow_revoke_all_operation, (inviter) )
FC_REFLECT( sponsor::protocol::invite_escrowed_operation, (inviter)(invitee)(amount) )
FC_REFLECT( sponsor::protocol::invite_redeemed_operation, (inviter)(invitee)(amount) )
FC_REFLECT( sponsor::protocol::invite_refunded_operation, (inviter)(invitee)(amount) )
FC_REFLECT( sponsor::protocol::invite_revoked_operation, (inviter)(invitee)(amount) )
