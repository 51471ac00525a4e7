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

namespace sponsor { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   _index.resize(_index_size);
   _undo_db.enable();
}

const object* object_database::find_object( const object_id_type& id )const
{
   return get_index( id.type() ).find( id );
}
const object& object_database::get_object( const object_id_type& id )const
{
   return get_index( id.type() ).get( id );
}

const index& object_database::get_index( uint8_t type_id )const
{
   FC_ASSERT( _index.size() > type_id,
              "Database index ${type_id} does not exist, index size is ${index.size}",
              ("type_id",type_id)("index.size",_index.size()) );
   const auto& tmp = _index[type_id]; // it is a unique_ptr
   FC_ASSERT( tmp != nullptr, "Database index ${type_id} has not been initialized", ("type_id",type_id) );
   return *tmp;
}
index& object_database::get_mutable_index( uint8_t type_id )
{
   FC_ASSERT( _index.size() > type_id,
              "Database index ${type_id} does not exist, index size is ${index.size}",
              ("type_id",type_id)("index.size",_index.size()) );
   const auto& idx = _index[type_id]; // it is a unique_ptr
   FC_ASSERT( idx != nullptr, "Database index ${type_id} has not been initialized", ("type_id",type_id) );
   return *idx;
}

void object_database::save_undo( const object& obj )
{
   _undo_db.on_modify( obj );
}

void object_database::save_undo_add( const object& obj )
{
   _undo_db.on_create( obj );
}

void object_database::save_undo_remove( const object& obj )
{
   _undo_db.on_remove( obj );
}

} } // namespace sponsor::db
