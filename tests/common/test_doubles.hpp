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

#include <sponsor/chain/database.hpp>
#include <sponsor/hub/memory_hub.hpp>

#include <map>

namespace sponsor { namespace chain { namespace test {

/**
 *  Records the payments of the ledger instead of moving tokens.  The balance reported for each
 *  token can be set freely.
 */
class recording_vault : public value_mover
{
   public:
      struct payment
      {
         address     to;
         amount_type amount;
         bool        wrapped = false;
      };

      virtual void transfer_original( const address& to, const amount_type& amount ) override;
      virtual void convert_and_transfer( const address& to, const amount_type& amount ) override;
      virtual amount_type held_balance( const address& token_owner )const override;

      void set_held( const address& token_owner, const amount_type& amount ) { held[token_owner] = amount; }

      std::map<address, amount_type> held;
      vector<payment>                payments;
};

/** keeps balances unchanged for a number of days, then drops them to zero */
class cliff_decay : public decay_function
{
   public:
      explicit cliff_decay( uint64_t lifetime ):_lifetime(lifetime){}

      virtual amount_type project( const amount_type& initial, uint64_t days )const override
      {
         return days < _lifetime ? initial : amount_type( 0 );
      }

   private:
      uint64_t _lifetime;
};

/**
 *  A ledger that uses a memory hub for identities and time but pays through a recording_vault and
 *  decays with a cliff_decay.  Operations are pushed directly, the hub's balances are not involved.
 */
struct recording_fixture
{
   static const uint64_t lifetime = 10;

   cliff_decay          decay;
   hub::memory_hub      hub;
   recording_vault      vault;
   database             db;

   vector<operation>    notifications;

   recording_fixture();

   address register_human( const string& name );
   /** makes @p inviter trust @p invitee and escrows @p amount for it */
   void    invite( const address& inviter, const address& invitee, const amount_type& amount );
};

} } } // sponsor::chain::test
