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

#include <sponsor/hub/memory_hub.hpp>
#include <sponsor/chain/database.hpp>

#include <fc/variant_object.hpp>

#include <iosfwd>

namespace sponsor { namespace hub {

   /**
    * One line of a replay script.  Which fields are used depends on the action.
    */
   struct replay_step
   {
      string                  action;
      string                  actor;
      optional<string>        counterpart;
      optional<uint64_t>      units;
      optional<string>        amount;
      optional<uint32_t>      days;
   };

   /**
    *  Drives a memory hub and its ledger from replay steps.  Escrows go through the hub like a
    *  real transfer, the other ledger operations are pushed directly.
    */
   class replay_session
   {
      public:
         replay_session( chain::database& db, memory_hub& hub, const address& ledger_account, std::ostream& out )
            : _db(db), _hub(hub), _ledger_account(ledger_account), _out(out) {}

         /** throws if the step is malformed or the hub or ledger rejects it */
         void run_step( const replay_step& step );

         /** runs every step, logs the failures and returns how many steps failed */
         uint32_t run( const vector<replay_step>& steps );

         /** balances and relationships of @p who */
         fc::variant_object report( const address& who )const;

      private:
         chain::database& _db;
         memory_hub&      _hub;
         address          _ledger_account;
         std::ostream&    _out;
   };

   /** literal addresses are taken as they are, any other name is hashed into one */
   address to_address( const string& name );

} } // sponsor::hub

FC_REFLECT( sponsor::hub::replay_step, (action)(actor)(counterpart)(units)(amount)(days) )
