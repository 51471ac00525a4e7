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

#include <sponsor/chain/database.hpp>
#include <sponsor/chain/exceptions.hpp>

#include "../common/ledger_fixture.hpp"
#include "../common/test_doubles.hpp"

using namespace sponsor::chain;
using namespace sponsor::chain::test;

namespace {

amount_type units( uint64_t n )
{
   return ledger_fixture::units( n );
}

escrow_redeem_operation redeem_op( const address& invitee, const address& inviter )
{
   escrow_redeem_operation op;
   op.invitee = invitee;
   op.inviter = inviter;
   return op;
}

escrow_revoke_operation revoke_op( const address& inviter, const address& invitee )
{
   escrow_revoke_operation op;
   op.inviter = inviter;
   op.invitee = invitee;
   return op;
}

escrow_revoke_all_operation revoke_all_op( const address& inviter )
{
   escrow_revoke_all_operation op;
   op.inviter = inviter;
   return op;
}

}

BOOST_FIXTURE_TEST_SUITE( escrow_settlement_tests, recording_fixture )

BOOST_AUTO_TEST_CASE( revoke_is_capped_by_held_balance )
{ try {
   const address inviter = register_human( "inviter" );
   const address invitee = address::from_seed( "invitee" );
   invite( inviter, invitee, units( 100 ) );
   vault.set_held( inviter, units( 40 ) );
   notifications.clear();

   db.push_operation( revoke_op( inviter, invitee ) );

   BOOST_REQUIRE_EQUAL( vault.payments.size(), 1u );
   BOOST_CHECK( vault.payments[0].to == inviter );
   BOOST_CHECK( vault.payments[0].amount == units( 40 ) );
   BOOST_CHECK( vault.payments[0].wrapped );

   // the notification reports what the ledger settled
   BOOST_REQUIRE_EQUAL( notifications.size(), 1u );
   BOOST_CHECK( notifications[0].get<invite_revoked_operation>().amount == units( 100 ) );
   BOOST_CHECK( db.find_escrow( inviter, invitee ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_vault_skips_transfer )
{ try {
   const address inviter = register_human( "inviter" );
   const address invitee = address::from_seed( "invitee" );
   invite( inviter, invitee, units( 100 ) );
   vault.set_held( inviter, 0 );
   notifications.clear();

   db.push_operation( redeem_op( invitee, inviter ) );

   BOOST_CHECK( vault.payments.empty() );
   BOOST_REQUIRE_EQUAL( notifications.size(), 1u );
   BOOST_CHECK( notifications[0].get<invite_redeemed_operation>().amount == units( 100 ) );
   BOOST_CHECK( db.list_inviters( invitee ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( redeem_pays_in_both_forms )
{ try {
   const address chosen = register_human( "chosen" );
   const address other = register_human( "other" );
   const address invitee = address::from_seed( "invitee" );
   invite( chosen, invitee, units( 100 ) );
   invite( other, invitee, units( 97 ) );

   db.push_operation( redeem_op( invitee, chosen ) );

   // the chosen inviter is paid before the refunds
   BOOST_REQUIRE_EQUAL( vault.payments.size(), 2u );
   BOOST_CHECK( vault.payments[0].to == chosen );
   BOOST_CHECK( vault.payments[0].amount == units( 100 ) );
   BOOST_CHECK( !vault.payments[0].wrapped );
   BOOST_CHECK( vault.payments[1].to == other );
   BOOST_CHECK( vault.payments[1].amount == units( 97 ) );
   BOOST_CHECK( vault.payments[1].wrapped );
   BOOST_CHECK( vault.held_balance( chosen ) == 0 );
   BOOST_CHECK( vault.held_balance( other ) == 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( revoke_all_makes_one_payment )
{ try {
   const address inviter = register_human( "inviter" );
   for( const char* name : { "a", "b", "c" } )
      invite( inviter, address::from_seed( name ), units( 100 ) );
   notifications.clear();

   db.push_operation( revoke_all_op( inviter ) );

   BOOST_REQUIRE_EQUAL( vault.payments.size(), 1u );
   BOOST_CHECK( vault.payments[0].to == inviter );
   BOOST_CHECK( vault.payments[0].amount == units( 300 ) );
   BOOST_CHECK( vault.payments[0].wrapped );
   BOOST_CHECK_EQUAL( notifications.size(), 3u );
   BOOST_CHECK( db.list_invitees( inviter ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fully_decayed_escrow )
{ try {
   const address inviter = register_human( "inviter" );
   const address invitee = address::from_seed( "invitee" );
   invite( inviter, invitee, units( 100 ) );
   hub.advance_days( lifetime );
   notifications.clear();

   BOOST_CHECK( db.get_escrowed_amount_and_days( inviter, invitee ).amount == 0 );
   BOOST_CHECK_THROW( db.push_operation( revoke_op( inviter, invitee ) ), escrow_revoke_no_such_relationship );
   BOOST_CHECK_THROW( db.push_operation( redeem_op( invitee, inviter ) ), escrow_redeem_no_such_relationship );
   BOOST_CHECK( db.find_escrow( inviter, invitee ) != nullptr );

   // revoking everything still clears the record
   db.push_operation( revoke_all_op( inviter ) );
   BOOST_CHECK( vault.payments.empty() );
   BOOST_CHECK( db.find_escrow( inviter, invitee ) == nullptr );
   BOOST_CHECK( db.list_inviters( invitee ).empty() );
   BOOST_REQUIRE_EQUAL( notifications.size(), 1u );
   BOOST_CHECK( notifications[0].get<invite_revoked_operation>().amount == 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_operations_publish_nothing )
{ try {
   const address inviter = register_human( "inviter" );
   const address invitee = address::from_seed( "invitee" );
   notifications.clear();

   BOOST_CHECK_THROW( db.push_operation( revoke_op( inviter, invitee ) ), escrow_revoke_no_such_relationship );
   BOOST_CHECK_THROW( db.push_operation( revoke_op( address(), invitee ) ), fc::assert_exception );
   BOOST_CHECK( notifications.empty() );
   BOOST_CHECK( vault.payments.empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
