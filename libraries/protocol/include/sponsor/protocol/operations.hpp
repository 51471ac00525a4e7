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
#include <sponsor/protocol/invitation.hpp>

namespace sponsor { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ escrow_invite_operation,
            /*  1 */ escrow_redeem_operation,
            /*  2 */ escrow_revoke_operation,
            /*  3 */ escrow_revoke_all_operation,
            /*  4 */ invite_escrowed_operation,  // VIRTUAL
            /*  5 */ invite_redeemed_operation,  // VIRTUAL
            /*  6 */ invite_refunded_operation,  // VIRTUAL
            /*  7 */ invite_revoked_operation    // VIRTUAL
         > operation;

   /// @} // operations group

   void operation_validate( const operation& op );

   bool is_virtual_operation( const operation& op );

} } // sponsor::protocol

FC_REFLECT_TYPENAME( sponsor::protocol::operation )
