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
#include <sponsor/chain/relationship_index.hpp>

namespace sponsor { namespace chain {

const relationship_link_object* relationship_index::find_link( const address& owner, const address& value )const
{
   const auto& links = _db.get_index_type<relationship_link_index>().indices().get<by_link>();
   auto itr = links.find( boost::make_tuple( uint8_t(_kind), owner, value ) );
   if( itr == links.end() )
      return nullptr;
   return &*itr;
}

void relationship_index::insert( const address& owner, const address& value )
{ try {
   FC_ASSERT( !value.is_null() && !value.is_sentinel(), "Cannot link a reserved address" );
   FC_ASSERT( find_link( owner, value ) == nullptr, "Value is already linked" );

   const address sentinel = address::sentinel();
   const relationship_link_object* head = find_link( owner, sentinel );
   address previous_first = sentinel;
   if( head == nullptr )
   {
      _db.create<relationship_link_object>( [&]( relationship_link_object& link ) {
         link.list  = uint8_t(_kind);
         link.owner = owner;
         link.value = sentinel;
         link.next  = value;
      });
   }
   else
   {
      previous_first = head->next;
      _db.modify( *head, [&]( relationship_link_object& link ) {
         link.next = value;
      });
   }

   _db.create<relationship_link_object>( [&]( relationship_link_object& link ) {
      link.list  = uint8_t(_kind);
      link.owner = owner;
      link.value = value;
      link.next  = previous_first;
   });
} FC_CAPTURE_AND_RETHROW( (owner)(value)(_kind) ) }

void relationship_index::remove( const address& owner, const address& value )
{ try {
   if( value.is_null() || value.is_sentinel() )
      return;
   const relationship_link_object* target = find_link( owner, value );
   if( target == nullptr )
      return;

   const address sentinel = address::sentinel();
   const relationship_link_object* previous = find_link( owner, sentinel );
   FC_ASSERT( previous != nullptr, "Relationship list without head" );
   while( previous->next != value )
   {
      FC_ASSERT( previous->next != sentinel, "Linked value missing from its list" );
      previous = find_link( owner, previous->next );
      FC_ASSERT( previous != nullptr, "Broken relationship list" );
   }

   const address following = target->next;
   _db.remove( *target );

   if( previous->value == sentinel && following == sentinel )
      _db.remove( *previous );
   else
      _db.modify( *previous, [&]( relationship_link_object& link ) {
         link.next = following;
      });
} FC_CAPTURE_AND_RETHROW( (owner)(value)(_kind) ) }

vector<address> relationship_index::enumerate( const address& owner )const
{
   vector<address> result;
   const address sentinel = address::sentinel();
   const relationship_link_object* link = find_link( owner, sentinel );
   if( link == nullptr )
      return result;
   while( link->next != sentinel )
   {
      result.push_back( link->next );
      link = find_link( owner, link->next );
      FC_ASSERT( link != nullptr, "Broken relationship list", ("owner",owner)("kind",_kind) );
   }
   return result;
}

bool relationship_index::contains( const address& owner, const address& value )const
{
   if( value.is_null() || value.is_sentinel() )
      return false;
   return find_link( owner, value ) != nullptr;
}

size_t relationship_index::size( const address& owner )const
{
   return enumerate( owner ).size();
}

} } // sponsor::chain
