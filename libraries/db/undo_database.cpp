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
#include <sponsor/db/object_database.hpp>
#include <sponsor/db/undo_database.hpp>

namespace sponsor { namespace db {

void undo_database::enable()  { _disabled = false; }
void undo_database::disable() { _disabled = true; }

undo_database::session undo_database::start_undo_session()
{
   if( _disabled ) return session( *this, false );
   _stack.emplace_back();
   return session( *this, true );
}

void undo_database::on_create( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   auto& state = _stack.back();
   const auto type = obj.id.type();
   if( state.old_index_next_ids.find( type ) == state.old_index_next_ids.end() )
      state.old_index_next_ids[type] = obj.id;
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   auto& state = _stack.back();
   if( state.new_ids.find( obj.id ) != state.new_ids.end() )
      return;
   if( state.old_values.find( obj.id ) != state.old_values.end() )
      return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   undo_state& state = _stack.back();
   if( state.new_ids.count( obj.id ) )
   {
      state.new_ids.erase( obj.id );
      return;
   }
   if( state.old_values.count( obj.id ) )
   {
      state.removed[obj.id] = std::move( state.old_values[obj.id] );
      state.old_values.erase( obj.id );
      return;
   }
   if( state.removed.count( obj.id ) ) return;
   state.removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled );
   FC_ASSERT( !_stack.empty() );
   disable();

   auto& state = _stack.back();
   for( auto& item : state.old_values )
   {
      _db.modify( _db.get_object( item.second->id ), [&]( object& obj ){ obj.move_from( *item.second ); } );
   }

   for( const auto& id : state.new_ids )
   {
      _db.remove( _db.get_object( id ) );
   }

   for( auto& item : state.old_index_next_ids )
   {
      _db.get_mutable_index( item.first ).set_next_id( item.second );
   }

   for( auto& item : state.removed )
      _db.insert( std::move( *item.second ) );

   _stack.pop_back();
   enable();
} FC_CAPTURE_AND_RETHROW() }

void undo_database::commit()
{
   FC_ASSERT( !_stack.empty() );
   if( _stack.size() == 1 )
   {
      _stack.pop_back();
      return;
   }

   auto& state = _stack.back();
   auto& prev_state = _stack[_stack.size()-2];
   for( auto& obj : state.old_values )
   {
      if( prev_state.new_ids.find( obj.first ) != prev_state.new_ids.end() )
         continue;
      if( prev_state.old_values.find( obj.first ) == prev_state.old_values.end() )
         prev_state.old_values[obj.first] = std::move( obj.second );
   }
   for( auto id : state.new_ids )
      prev_state.new_ids.insert( id );
   for( auto& item : state.old_index_next_ids )
   {
      if( prev_state.old_index_next_ids.find( item.first ) == prev_state.old_index_next_ids.end() )
         prev_state.old_index_next_ids[item.first] = item.second;
   }
   for( auto& obj : state.removed )
   {
      if( prev_state.new_ids.find( obj.first ) == prev_state.new_ids.end() )
      {
         if( prev_state.old_values.count( obj.first ) )
         {
            prev_state.removed[obj.first] = std::move( prev_state.old_values[obj.first] );
            prev_state.old_values.erase( obj.first );
         }
         else if( !prev_state.removed.count( obj.first ) )
            prev_state.removed[obj.first] = std::move( obj.second );
      }
      else
         prev_state.new_ids.erase( obj.first );
   }
   _stack.pop_back();
}

} } // sponsor::db
