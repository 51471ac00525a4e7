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
#include <sponsor/db/object.hpp>
#include <sponsor/db/generic_index.hpp>

namespace sponsor { namespace chain {
   using namespace sponsor::db;

   /**
    *  @brief tokens an inviter has locked for one invitee
    *
    *  The record only exists while the escrow is active, its face value is therefore never zero.
    *  The current value is obtained by projecting face_value over the days elapsed since
    *  last_updated_day and is never stored.
    */
   class escrow_record_object : public abstract_object<escrow_record_object, escrow_record_object_type>
   {
      public:
         address         inviter;
         address         invitee;
         /// amount locked at creation
         amount_type     face_value;
         /// day at which face_value was anchored
         day_index_type  last_updated_day = 0;
   };

   /**
    *  Current value of an escrow and the number of days it has been decaying.
    */
   struct escrow_balance
   {
      amount_type     amount;
      day_index_type  days = 0;
   };

   struct by_pair;
   typedef multi_index_container<
      escrow_record_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_pair>,
            composite_key< escrow_record_object,
               member< escrow_record_object, address, &escrow_record_object::inviter >,
               member< escrow_record_object, address, &escrow_record_object::invitee >
            >
         >
      >
   > escrow_record_multi_index_type;

   typedef generic_index<escrow_record_object, escrow_record_multi_index_type> escrow_record_index;

} } // sponsor::chain

FC_REFLECT_DERIVED( sponsor::chain::escrow_record_object, (sponsor::db::object),
                    (inviter)(invitee)(face_value)(last_updated_day) )
FC_REFLECT( sponsor::chain::escrow_balance, (amount)(days) )
