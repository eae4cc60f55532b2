/*
   syncREate structure.cpp
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

#include <string>
#include <vector>
#include <json-c/json.h>

#include "utils.h"
#include "structure.h"

StructMember::StructMember(const string &name, int64_t offset, const string &type, uint32_t size) {
   this->name = name;
   this->offset = offset;
   this->type = type;
   this->size = size;
}

string StructMember::key() const {
   return formatOffset(offset);
}

json_object *StructMember::toJson() const {
   json_object *obj = json_object_new_object();
   append_json_string_val(obj, "member_name", name);
   append_json_int64_val(obj, "offset", offset);
   append_json_string_val(obj, "type", type);
   append_json_uint32_val(obj, "size", size);
   return obj;
}

bool StructMember::fromJson(json_object *obj) {
   if (!int64_from_json(obj, "offset", &offset) || !string_from_json(obj, "member_name", name)) {
      return false;
   }
   if (!string_from_json(obj, "type", type)) {
      type = "";
   }
   if (!uint32_from_json(obj, "size", &size)) {
      size = 0;
   }
   return true;
}

bool StructMember::operator==(const StructMember &other) const {
   return name == other.name && offset == other.offset && type == other.type && size == other.size;
}

Struct::Struct(const string &name, uint32_t size, int64_t last_change) : Artifact(last_change) {
   this->name = name;
   this->size = size;
}

string Struct::key() const {
   return name;
}

json_object *Struct::toJson() const {
   json_object *obj = json_object_new_object();
   append_json_string_val(obj, "name", name);
   append_json_uint32_val(obj, "size", size);
   append_json_int64_val(obj, "last_change", last_change);
   json_object_object_add_ex(obj, "members", dump_many(members), JSON_NEW_CONST_KEY);
   return obj;
}

bool Struct::fromJson(json_object *obj) {
   if (!string_from_json(obj, "name", name) || name.length() == 0) {
      return false;
   }
   if (!uint32_from_json(obj, "size", &size)) {
      size = 0;
   }
   if (!int64_from_json(obj, "last_change", &last_change)) {
      last_change = NEVER_CHANGED;
   }
   members.clear();
   json_object *jm;
   if (json_object_object_get_ex(obj, "members", &jm)) {
      vector<StructMember> vm = load_many<StructMember>(jm);
      for (vector<StructMember>::iterator i = vm.begin(); i != vm.end(); i++) {
         members[i->offset] = *i;
      }
   }
   return true;
}

void Struct::addMember(const string &name, int64_t offset, const string &type, uint32_t size) {
   members[offset] = StructMember(name, offset, type, size);
}

bool Struct::operator==(const Struct &other) const {
   return name == other.name && size == other.size && members == other.members;
}
