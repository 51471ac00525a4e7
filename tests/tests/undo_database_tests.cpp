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

#include <sponsor/chain/escrow_record_object.hpp>
#include <sponsor/db/object_database.hpp>

#include "../common/ledger_fixture.hpp"

using namespace sponsor::chain;
using namespace sponsor::db;

namespace {

struct undo_fixture
{
   object_database odb;
   const address   inviter = address::from_seed( "inviter" );

   undo_fixture()
   {
      odb.add_index< escrow_record_index >();
   }

   const escrow_record_object& create( const string& invitee, uint64_t value )
   {
      return odb.create<escrow_record_object>( [&]( escrow_record_object& r ) {
         r.inviter    = inviter;
         r.invitee    = address::from_seed( invitee );
         r.face_value = value;
      });
   }

   const escrow_record_object* find( const string& invitee )const
   {
      const auto& idx = odb.get_index_type<escrow_record_index>().indices().get<by_pair>();
      auto itr = idx.find( boost::make_tuple( inviter, address::from_seed( invitee ) ) );
      return itr == idx.end() ? nullptr : &*itr;
   }

   size_t size()const { return odb.get_index<escrow_record_object>().size(); }
};

}

BOOST_FIXTURE_TEST_SUITE( undo_database_tests, undo_fixture )

BOOST_AUTO_TEST_CASE( undo_restores_created_modified_and_removed_objects )
{ try {
   const auto& kept     = create( "kept", 1 );
   const auto& modified = create( "modified", 2 );
   create( "removed", 3 );
   const object_id_type modified_id = modified.id;
   BOOST_CHECK_EQUAL( size(), 3u );

   {
      auto session = odb._undo_db.start_undo_session();
      create( "created", 4 );
      odb.modify( modified, []( escrow_record_object& r ) { r.face_value = 20; } );
      odb.remove( *find( "removed" ) );
      BOOST_CHECK( find( "created" ) != nullptr );
      BOOST_CHECK( find( "removed" ) == nullptr );
      BOOST_CHECK( odb.get<escrow_record_object>( modified_id ).face_value == 20 );
   }

   BOOST_CHECK_EQUAL( size(), 3u );
   BOOST_CHECK( find( "created" ) == nullptr );
   BOOST_REQUIRE( find( "removed" ) != nullptr );
   BOOST_CHECK( find( "removed" )->face_value == 3 );
   BOOST_CHECK( odb.get<escrow_record_object>( modified_id ).face_value == 2 );
   BOOST_CHECK( kept.face_value == 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_resets_the_next_id )
{ try {
   create( "first", 1 );
   object_id_type next;
   {
      auto session = odb._undo_db.start_undo_session();
      next = create( "second", 2 ).id;
   }
   BOOST_CHECK( create( "third", 3 ).id == next );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( commit_keeps_changes )
{ try {
   {
      auto session = odb._undo_db.start_undo_session();
      create( "committed", 1 );
      session.commit();
   }
   BOOST_CHECK( find( "committed" ) != nullptr );
   BOOST_CHECK_EQUAL( odb._undo_db.size(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( committed_inner_session_is_undone_by_outer )
{ try {
   const auto& existing = create( "existing", 5 );
   const object_id_type existing_id = existing.id;
   {
      auto outer = odb._undo_db.start_undo_session();
      create( "outer", 1 );
      {
         auto inner = odb._undo_db.start_undo_session();
         create( "inner", 2 );
         odb.modify( odb.get<escrow_record_object>( existing_id ), []( escrow_record_object& r ) {
            r.face_value = 50;
         });
         inner.commit();
      }
      BOOST_CHECK( find( "inner" ) != nullptr );
      BOOST_CHECK_EQUAL( odb._undo_db.size(), 1u );
      odb.remove( odb.get<escrow_record_object>( existing_id ) );
   }
   BOOST_CHECK( find( "outer" ) == nullptr );
   BOOST_CHECK( find( "inner" ) == nullptr );
   BOOST_REQUIRE( find( "existing" ) != nullptr );
   BOOST_CHECK( find( "existing" )->face_value == 5 );
   BOOST_CHECK_EQUAL( size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( uniqueness_is_enforced )
{ try {
   create( "twice", 1 );
   SPONSOR_REQUIRE_THROW( create( "twice", 2 ), fc::exception );
   BOOST_CHECK_EQUAL( size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
