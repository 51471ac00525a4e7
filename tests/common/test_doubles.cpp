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
#include "test_doubles.hpp"
#include "ledger_fixture.hpp"

namespace sponsor { namespace chain { namespace test {

void recording_vault::transfer_original( const address& to, const amount_type& amount )
{
   payment p;
   p.to = to;
   p.amount = amount;
   payments.push_back( p );
   held[to] -= amount;
}

void recording_vault::convert_and_transfer( const address& to, const amount_type& amount )
{
   payment p;
   p.to = to;
   p.amount = amount;
   p.wrapped = true;
   payments.push_back( p );
   held[to] -= amount;
}

amount_type recording_vault::held_balance( const address& token_owner )const
{
   auto itr = held.find( token_owner );
   return itr == held.end() ? amount_type( 0 ) : itr->second;
}

const uint64_t recording_fixture::lifetime;

recording_fixture::recording_fixture()
   : decay( lifetime ),
     hub( decay, fc::time_point_sec( ledger_fixture::day_zero ) ),
     db( hub, vault, hub, decay, ledger_fixture::default_parameters( hub ) )
{
   db.applied_operation.connect( [this]( const operation& vop ) {
      notifications.push_back( vop );
   });
}

address recording_fixture::register_human( const string& name )
{
   const address avatar = address::from_seed( name );
   hub.register_human( avatar );
   return avatar;
}

void recording_fixture::invite( const address& inviter, const address& invitee, const amount_type& amount )
{
   hub.trust( inviter, invitee );
   escrow_invite_operation op;
   op.hub              = hub.hub_address();
   op.operator_account = inviter;
   op.from             = inviter;
   op.token_id         = inviter;
   op.amount           = amount;
   op.payload          = encode_counterpart( invitee );
   db.push_operation( op );
   vault.held[inviter] += amount;
}

} } } // sponsor::chain::test
