/*
   syncREate stack_variable.cpp
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

#include <stdio.h>
#include <string>
#include <json-c/json.h>

#include "utils.h"
#include "stack_variable.h"

static const char *offsetTypeNames[] = {
   "binja",
   "ida",
   "ghidra",
   "angr"
};

const char *offsetTypeName(int type) {
   if (type < OFFSET_BINJA || type > OFFSET_ANGR) {
      return "unknown";
   }
   return offsetTypeNames[type];
}

static bool sameFamily(StackOffsetType t) {
   return t == OFFSET_IDA || t == OFFSET_BINJA;
}

StackVariable::StackVariable(int64_t stack_offset, StackOffsetType offset_type, const string &name,
                             const string &type, uint32_t size, uint64_t func_addr, int64_t last_change) : Artifact(last_change) {
   this->stack_offset = stack_offset;
   this->offset_type = offset_type;
   this->name = name;
   this->type = type;
   this->size = size;
   this->func_addr = func_addr;
}

string StackVariable::key() const {
   return formatOffset(stack_offset);
}

json_object *StackVariable::toJson() const {
   json_object *obj = json_object_new_object();
   append_json_uint64_val(obj, "func_addr", func_addr);
   append_json_string_val(obj, "name", name);
   append_json_int64_val(obj, "stack_offset", stack_offset);
   append_json_int32_val(obj, "stack_offset_type", (int32_t)offset_type);
   append_json_uint32_val(obj, "size", size);
   append_json_string_val(obj, "type", type);
   append_json_int64_val(obj, "last_change", last_change);
   return obj;
}

bool StackVariable::fromJson(json_object *obj) {
   int32_t ot;
   if (!int64_from_json(obj, "stack_offset", &stack_offset) ||
       !uint64_from_json(obj, "func_addr", &func_addr) ||
       !int32_from_json(obj, "stack_offset_type", &ot)) {
      return false;
   }
   if (ot < OFFSET_BINJA || ot > OFFSET_ANGR) {
      return false;
   }
   offset_type = (StackOffsetType)ot;
   if (!string_from_json(obj, "name", name)) {
      name = "";
   }
   if (!string_from_json(obj, "type", type)) {
      type = "";
   }
   if (!uint32_from_json(obj, "size", &size)) {
      size = 0;
   }
   if (!int64_from_json(obj, "last_change", &last_change)) {
      last_change = NEVER_CHANGED;
   }
   return true;
}

int64_t StackVariable::getOffset(StackOffsetType target) const {
   if (target == offset_type) {
      return stack_offset;
   }
   if (!sameFamily(offset_type) || !sameFamily(target)) {
      char buf[128];
      snprintf(buf, sizeof(buf), "no stack offset conversion from %s to %s",
               offsetTypeName(offset_type), offsetTypeName(target));
      throw UnsupportedOffsetConversion(buf);
   }
   return stack_offset;
}

bool StackVariable::operator==(const StackVariable &other) const {
   return stack_offset == other.stack_offset && name == other.name &&
          type == other.type && size == other.size && func_addr == other.func_addr;
}
