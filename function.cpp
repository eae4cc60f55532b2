/*
   syncREate function.cpp
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
#include <json-c/json.h>

#include "utils.h"
#include "function.h"

Function::Function(uint64_t addr, const string &name, int64_t last_change) : Artifact(last_change) {
   this->addr = addr;
   this->name = name;
}

string Function::key() const {
   return formatAddr(addr);
}

json_object *Function::toJson() const {
   json_object *obj = json_object_new_object();
   append_json_uint64_val(obj, "addr", addr);
   append_json_string_val(obj, "name", name);
   append_json_int64_val(obj, "last_change", last_change);
   return obj;
}

bool Function::fromJson(json_object *obj) {
   if (!uint64_from_json(obj, "addr", &addr)) {
      return false;
   }
   if (!string_from_json(obj, "name", name)) {
      name = "";
   }
   if (!int64_from_json(obj, "last_change", &last_change)) {
      last_change = NEVER_CHANGED;
   }
   return true;
}

bool Function::operator==(const Function &other) const {
   return addr == other.addr && name == other.name;
}
