/*
   syncREate stack_variable.h
   Copyright (C) 2018 Chris Eagle <cseagle at gmail d0t com>
   Copyright (C) 2018 Tim Vidas <tvidas at gmail d0t com>

   This program is free software; you can redistribute it and/or modify it
   under the terms of the GNU General Public License as published by the Free
   Software Foundation; either version 2 of the License, or (at your option)
   any later version.

   This program is distributed in the hope that it will be useful, but WITHOUT
   ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
   FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
   more details.

   You should have received a copy of the GNU General Public License along with
   this program; if not, write to the Free Software Foundation, Inc., 59 Temple
   Place, Suite 330, Boston, MA 02111-1307 USA
 */

#ifndef __SYNC_STACK_VARIABLE_H
#define __SYNC_STACK_VARIABLE_H

#include <stdint.h>
#include <string>
#include <json-c/json.h>

#include "artifact.h"

using namespace std;

/**
 * The stack offset conventions of the tools analysts work in. IDA and
 * Binary Ninja measure offsets the same way, the others do not and no
 * conversion between the two families exists yet.
 */
enum StackOffsetType {
   OFFSET_BINJA = 0,
   OFFSET_IDA = 1,
   OFFSET_GHIDRA = 2,
   OFFSET_ANGR = 3
};

const char *offsetTypeName(int type);

/**
 * StackVariable
 * A named, typed variable in a function's stack frame
 */
class StackVariable : public Artifact {
public:
   StackVariable(int64_t stack_offset = 0, StackOffsetType offset_type = OFFSET_IDA,
                 const string &name = "", const string &type = "", uint32_t size = 0,
                 uint64_t func_addr = 0, int64_t last_change = NEVER_CHANGED);

   string key() const;
   json_object *toJson() const;
   bool fromJson(json_object *obj);

   /**
    * getOffset converts this variable's offset into another convention
    * @param target the convention the caller works in
    * @return the offset expressed in target's convention
    * @throws UnsupportedOffsetConversion if the conventions are incompatible
    */
   int64_t getOffset(StackOffsetType target) const;

   //equality ignores last_change and which convention produced the offset
   bool operator==(const StackVariable &other) const;
   bool operator!=(const StackVariable &other) const {return !(*this == other);};

   uint64_t func_addr;
   string name;
   int64_t stack_offset;
   StackOffsetType offset_type;
   uint32_t size;
   string type;
};

#endif
