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

#include <sponsor/chain/types.hpp>

namespace sponsor { namespace chain {

   /**
    *  Registry of avatars and of the trust relations between them.
    */
   class identity_oracle
   {
      public:
         virtual ~identity_oracle(){}

         /** true if @p a may lock tokens for invitees */
         virtual bool is_eligible_principal( const address& a )const = 0;
         /** true if @p a completed onboarding and can no longer be invited */
         virtual bool is_onboarded( const address& a )const = 0;
         /** true if @p truster currently trusts @p trustee */
         virtual bool trusts( const address& truster, const address& trustee )const = 0;
   };

   /**
    *  Moves the tokens held by the ledger.  The personal token an escrow locks is always the
    *  inviter's own, so the recipient of a payment also names the token.
    */
   class value_mover
   {
      public:
         virtual ~value_mover(){}

         /** pays @p amount of @p to's personal token back to @p to */
         virtual void transfer_original( const address& to, const amount_type& amount ) = 0;
         /** wraps @p amount of @p to's personal token and pays the wrapped tokens to @p to */
         virtual void convert_and_transfer( const address& to, const amount_type& amount ) = 0;
         /** current balance of @p token_owner's personal token held by the ledger */
         virtual amount_type held_balance( const address& token_owner )const = 0;
   };

   class time_source
   {
      public:
         virtual ~time_source(){}
         virtual day_index_type today()const = 0;
   };

} } // sponsor::chain
