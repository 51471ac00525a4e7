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
#include <boost/test/unit_test.hpp>

#include <sponsor/chain/demurrage.hpp>
#include <sponsor/hub/memory_hub.hpp>
#include <sponsor/hub/transfer_receiver.hpp>

#include "../common/ledger_fixture.hpp"

using namespace sponsor::chain;
using namespace sponsor::chain::test;
using namespace sponsor::hub;

namespace {

class rejecting_receiver : public transfer_receiver
{
   public:
      virtual void on_received( const address& hub, const address& operator_account, const address& from,
                                const address& token_id, const amount_type& amount,
                                const vector<char>& payload ) override
      {
         last_payload = payload;
         FC_THROW( "Not accepting ${amount}", ("amount",amount) );
      }

      vector<char> last_payload;
};

struct hub_fixture
{
   demurrage_calculator decay;
   memory_hub           hub;

   hub_fixture() : hub( decay, fc::time_point_sec( ledger_fixture::day_zero ) ) {}

   static amount_type units( uint64_t n ) { return ledger_fixture::units( n ); }
};

}

BOOST_FIXTURE_TEST_SUITE( memory_hub_tests, hub_fixture )

BOOST_AUTO_TEST_CASE( registration )
{ try {
   const address alice = address::from_seed( "alice" );
   const address acme = address::from_seed( "acme" );

   BOOST_CHECK( !hub.is_onboarded( alice ) );
   hub.register_human( alice );
   hub.register_organization( acme );

   BOOST_CHECK( hub.is_onboarded( alice ) );
   BOOST_CHECK( hub.is_eligible_principal( alice ) );
   BOOST_CHECK( hub.is_onboarded( acme ) );
   BOOST_CHECK( !hub.is_eligible_principal( acme ) );
   BOOST_REQUIRE( hub.find_avatar( acme ).valid() );
   BOOST_CHECK( *hub.find_avatar( acme ) == organization_avatar );

   BOOST_CHECK_THROW( hub.register_human( alice ), fc::exception );
   BOOST_CHECK_THROW( hub.register_organization( alice ), fc::exception );
   BOOST_CHECK_THROW( hub.register_human( address::sentinel() ), fc::exception );
   BOOST_CHECK_THROW( hub.issue( address::from_seed( "nobody" ), units( 1 ) ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( invited_registration_burns_cost )
{ try {
   const address inviter = address::from_seed( "inviter" );
   const address invitee = address::from_seed( "invitee" );
   hub.register_human( inviter );
   hub.issue( inviter, units( 100 ) );

   BOOST_CHECK_THROW( hub.register_human( invitee, inviter ), fc::exception );
   BOOST_CHECK( !hub.is_onboarded( invitee ) );

   hub.trust( inviter, invitee );
   hub.register_human( invitee, inviter );
   BOOST_CHECK( hub.is_eligible_principal( invitee ) );
   BOOST_CHECK( hub.balance_of( inviter, inviter ) == units( 100 - SPONSOR_INVITATION_COST_UNITS ) );

   // not enough left for another invitation
   const address second = address::from_seed( "second" );
   hub.trust( inviter, second );
   BOOST_CHECK_THROW( hub.register_human( second, inviter ), fc::exception );
   BOOST_CHECK( !hub.is_onboarded( second ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( trust_expires )
{ try {
   const address a = address::from_seed( "a" );
   const address b = address::from_seed( "b" );

   BOOST_CHECK( !hub.trusts( a, b ) );
   hub.trust( a, b, hub.now() + 10 );
   BOOST_CHECK( hub.trusts( a, b ) );
   BOOST_CHECK( !hub.trusts( b, a ) );

   hub.advance( 10 );
   BOOST_CHECK( !hub.trusts( a, b ) );

   hub.trust( a, b );
   BOOST_CHECK( hub.trusts( a, b ) );
   hub.untrust( a, b );
   BOOST_CHECK( !hub.trusts( a, b ) );
   BOOST_CHECK_THROW( hub.trust( a, a ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( clock_counts_whole_days )
{ try {
   BOOST_CHECK_EQUAL( hub.today(), 0u );
   hub.advance( SPONSOR_SECONDS_PER_DAY - 1 );
   BOOST_CHECK_EQUAL( hub.today(), 0u );
   hub.advance( 1 );
   BOOST_CHECK_EQUAL( hub.today(), 1u );
   hub.advance_days( 364 );
   BOOST_CHECK_EQUAL( hub.today(), 365u );
   BOOST_CHECK( hub.day_zero() == fc::time_point_sec( ledger_fixture::day_zero ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( balances_decay )
{ try {
   const address alice = address::from_seed( "alice" );
   hub.register_human( alice );
   hub.issue( alice, units( 100 ) );

   hub.advance_days( 365 );
   BOOST_CHECK( hub.balance_of( alice, alice ) == amount_type( "93004619604419026427" ) );

   hub.wrap( alice, alice, units( 50 ) );
   BOOST_CHECK( hub.wrapped_balance_of( alice, alice ) == units( 50 ) );
   BOOST_CHECK( hub.balance_of( alice, alice ) == amount_type( "93004619604419026427" ) - units( 50 ) );

   hub.advance_days( 365 );
   BOOST_CHECK( hub.wrapped_balance_of( alice, alice ) == decay.project( units( 50 ), 365 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfers_move_balances )
{ try {
   const address alice = address::from_seed( "alice" );
   const address bob = address::from_seed( "bob" );
   hub.register_human( alice );
   hub.issue( alice, units( 10 ) );

   hub.safe_transfer_from( alice, alice, bob, alice, units( 4 ) );
   BOOST_CHECK( hub.balance_of( alice, alice ) == units( 6 ) );
   BOOST_CHECK( hub.balance_of( bob, alice ) == units( 4 ) );

   BOOST_CHECK_THROW( hub.safe_transfer_from( bob, bob, alice, alice, units( 5 ) ), fc::exception );
   BOOST_CHECK_THROW( hub.safe_transfer_from( alice, alice, address(), alice, units( 1 ) ), fc::exception );
   BOOST_CHECK( hub.balance_of( bob, alice ) == units( 4 ) );

   hub.wrap( bob, alice, units( 4 ) );
   hub.transfer_wrapped( bob, alice, alice, units( 3 ) );
   BOOST_CHECK( hub.wrapped_balance_of( alice, alice ) == units( 3 ) );
   BOOST_CHECK( hub.wrapped_balance_of( bob, alice ) == units( 1 ) );
   BOOST_CHECK( hub.balance_of( bob, alice ) == 0 );

   hub.burn( alice, alice, units( 6 ) );
   BOOST_CHECK( hub.balance_of( alice, alice ) == 0 );
   BOOST_CHECK_THROW( hub.burn( alice, alice, 1 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rejected_transfer_is_restored )
{ try {
   const address alice = address::from_seed( "alice" );
   const address shop = address::from_seed( "shop" );
   hub.register_human( alice );
   hub.issue( alice, units( 10 ) );

   rejecting_receiver receiver;
   hub.set_receiver( shop, &receiver );
   const vector<char> payload{ 'h', 'i' };
   BOOST_CHECK_THROW( hub.safe_transfer_from( alice, alice, shop, alice, units( 4 ), payload ), fc::exception );
   BOOST_CHECK( receiver.last_payload == payload );
   BOOST_CHECK( hub.balance_of( alice, alice ) == units( 10 ) );
   BOOST_CHECK( hub.balance_of( shop, alice ) == 0 );

   hub.set_receiver( shop, nullptr );
   hub.safe_transfer_from( alice, alice, shop, alice, units( 4 ), payload );
   BOOST_CHECK( hub.balance_of( shop, alice ) == units( 4 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( vault_moves_held_tokens )
{ try {
   const address alice = address::from_seed( "alice" );
   const address ledger = address::from_seed( "ledger" );
   hub.register_human( alice );
   hub.issue( alice, units( 10 ) );
   hub.safe_transfer_from( alice, alice, ledger, alice, units( 10 ) );

   account_vault& vault = hub.vault( ledger );
   BOOST_CHECK( &vault == &hub.vault( ledger ) );
   BOOST_CHECK( vault.account() == ledger );
   BOOST_CHECK( vault.held_balance( alice ) == units( 10 ) );

   vault.transfer_original( alice, units( 6 ) );
   vault.convert_and_transfer( alice, units( 4 ) );
   BOOST_CHECK( vault.held_balance( alice ) == 0 );
   BOOST_CHECK( hub.balance_of( alice, alice ) == units( 6 ) );
   BOOST_CHECK( hub.wrapped_balance_of( alice, alice ) == units( 4 ) );
   BOOST_CHECK( hub.wrapped_balance_of( ledger, alice ) == 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
