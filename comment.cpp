/*
   syncREate comment.cpp
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
#include "comment.h"

Comment::Comment(uint64_t func_addr, uint64_t addr, const string &comment, bool decompiled, int64_t last_change) : Artifact(last_change) {
   this->func_addr = func_addr;
   this->addr = addr;
   this->comment = comment;
   this->decompiled = decompiled;
}

string Comment::key() const {
   return formatAddr(addr);
}

json_object *Comment::toJson() const {
   json_object *obj = json_object_new_object();
   append_json_uint64_val(obj, "func_addr", func_addr);
   append_json_uint64_val(obj, "addr", addr);
   append_json_string_val(obj, "comment", comment);
   append_json_bool_val(obj, "decompiled", decompiled);
   append_json_int64_val(obj, "last_change", last_change);
   return obj;
}

bool Comment::fromJson(json_object *obj) {
   if (!uint64_from_json(obj, "addr", &addr) || !string_from_json(obj, "comment", comment)) {
      return false;
   }
   if (!uint64_from_json(obj, "func_addr", &func_addr)) {
      func_addr = 0;
   }
   if (!bool_from_json(obj, "decompiled", &decompiled)) {
      decompiled = false;
   }
   if (!int64_from_json(obj, "last_change", &last_change)) {
      last_change = NEVER_CHANGED;
   }
   return true;
}

bool Comment::operator==(const Comment &other) const {
   return func_addr == other.func_addr && addr == other.addr &&
          comment == other.comment && decompiled == other.decompiled;
}
