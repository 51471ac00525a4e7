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
#include <sponsor/chain/evaluator.hpp>
#include <sponsor/chain/escrow_record_object.hpp>

namespace sponsor { namespace chain {

   class escrow_invite_evaluator : public evaluator<escrow_invite_evaluator>
   {
      public:
         typedef escrow_invite_operation operation_type;

         void_result    do_evaluate( const escrow_invite_operation& o );
         object_id_type do_apply( const escrow_invite_operation& o );

      private:
         address _invitee;
   };

   class escrow_redeem_evaluator : public evaluator<escrow_redeem_evaluator>
   {
      public:
         typedef escrow_redeem_operation operation_type;

         void_result do_evaluate( const escrow_redeem_operation& o );
         void_result do_apply( const escrow_redeem_operation& o );
   };

   class escrow_revoke_evaluator : public evaluator<escrow_revoke_evaluator>
   {
      public:
         typedef escrow_revoke_operation operation_type;

         void_result do_evaluate( const escrow_revoke_operation& o );
         void_result do_apply( const escrow_revoke_operation& o );

      private:
         const escrow_record_object* _record = nullptr;
   };

   class escrow_revoke_all_evaluator : public evaluator<escrow_revoke_all_evaluator>
   {
      public:
         typedef escrow_revoke_all_operation operation_type;

         void_result do_evaluate( const escrow_revoke_all_operation& o );
         void_result do_apply( const escrow_revoke_all_operation& o );
   };

} } // sponsor::chain
