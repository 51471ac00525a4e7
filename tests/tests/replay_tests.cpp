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

#include <sponsor/hub/replay.hpp>

#include <fc/io/json.hpp>

#include <sstream>

#include "../common/ledger_fixture.hpp"

using namespace sponsor::chain;
using namespace sponsor::chain::test;
using namespace sponsor::hub;

namespace {

vector<replay_step> parse_steps( const string& json )
{
   return fc::json::from_string( json ).as< vector<replay_step> >( SPONSOR_MAX_NESTED_OBJECTS );
}

}

BOOST_FIXTURE_TEST_SUITE( replay_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( onboarding_script )
{ try {
   std::stringstream out;
   replay_session session( db, hub, ledger_account, out );

   const auto steps = parse_steps( R"([
      { "action": "register_human", "actor": "alice" },
      { "action": "issue",          "actor": "alice", "units": 1000 },
      { "action": "register_human", "actor": "carol" },
      { "action": "issue",          "actor": "carol", "amount": "1000000000000000000000" },
      { "action": "trust",          "actor": "alice", "counterpart": "bob" },
      { "action": "trust",          "actor": "carol", "counterpart": "bob", "days": 30 },
      { "action": "escrow",         "actor": "alice", "counterpart": "bob", "units": 100 },
      { "action": "escrow",         "actor": "carol", "counterpart": "bob", "units": 97 },
      { "action": "show",           "actor": "bob" },
      { "action": "redeem",         "actor": "bob",   "counterpart": "alice" },
      { "action": "show",           "actor": "alice" }
   ])" );

   BOOST_CHECK_EQUAL( session.run( steps ), 0u );

   const address alice = address::from_seed( "alice" );
   const address bob   = address::from_seed( "bob" );
   const address carol = address::from_seed( "carol" );
   BOOST_CHECK( db.list_inviters( bob ).empty() );
   BOOST_CHECK( hub.balance_of( alice, alice ) == units( 1000 ) );
   BOOST_CHECK( hub.balance_of( carol, carol ) == units( 903 ) );
   BOOST_CHECK( hub.wrapped_balance_of( carol, carol ) == units( 97 ) );
   BOOST_CHECK_EQUAL( notifications_of<invite_redeemed_operation>().size(), 1u );
   BOOST_CHECK_EQUAL( notifications_of<invite_refunded_operation>().size(), 1u );

   const auto alice_report = session.report( alice );
   BOOST_CHECK( alice_report["balance"].as<amount_type>( 1 ) == units( 1000 ) );
   BOOST_CHECK( alice_report["invitees"].get_array().empty() );
   BOOST_CHECK( out.str().find( "\"held_by_ledger\"" ) != string::npos );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_steps_are_counted )
{ try {
   std::stringstream out;
   replay_session session( db, hub, ledger_account, out );

   const auto steps = parse_steps( R"([
      { "action": "register_human", "actor": "alice" },
      { "action": "issue",          "actor": "alice", "units": 1000 },
      { "action": "escrow",         "actor": "alice", "counterpart": "bob", "units": 100 },
      { "action": "trust",          "actor": "alice", "counterpart": "bob" },
      { "action": "escrow",         "actor": "alice", "units": 100 },
      { "action": "redeem",         "actor": "bob",   "counterpart": "carol" },
      { "action": "advance_days",   "actor": "" },
      { "action": "dance",          "actor": "alice" },
      { "action": "escrow",         "actor": "alice", "counterpart": "bob", "units": 100 }
   ])" );

   BOOST_CHECK_EQUAL( session.run( steps ), 5u );
   BOOST_CHECK( db.list_inviters( address::from_seed( "bob" ) ) == vector<address>({ address::from_seed( "alice" ) }) );
   BOOST_CHECK( out.str().empty() );

   // a single step reports its failure to the caller
   replay_step step;
   step.action = "revoke";
   step.actor  = "alice";
   SPONSOR_CHECK_THROW( session.run_step( step ), fc::assert_exception );
   step.counterpart = string( "carol" );
   SPONSOR_CHECK_THROW( session.run_step( step ), escrow_revoke_no_such_relationship );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( actors_by_name_or_address )
{
   const address named = address::from_seed( "alice" );
   BOOST_CHECK( to_address( "alice" ) == named );
   BOOST_CHECK( to_address( string( named ) ) == named );
}

BOOST_AUTO_TEST_SUITE_END()
