/*
   syncREate artifact.cpp
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
#include "artifact.h"

string dump_json(json_object *obj) {
   size_t jlen;
   const char *json = json_object_to_json_string_length(obj, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED, &jlen);
   string res(json, jlen);
   res += "\n";
   return res;
}

json_object *parse_json(const string &s) {
   json_tokener *tok = json_tokener_new();
   json_object *obj = json_tokener_parse_ex(tok, s.c_str(), s.length());
   enum json_tokener_error jerr = json_tokener_get_error(tok);
   json_tokener_free(tok);
   if (jerr != json_tokener_success) {
      log(LDEBUG, "json parse failed: %s\n", json_tokener_error_desc(jerr));
      if (obj) {
         json_object_put(obj);
      }
      return NULL;
   }
   if (obj != NULL && !json_object_is_type(obj, json_type_object)) {
      json_object_put(obj);
      return NULL;
   }
   return obj;
}

string Artifact::serialize() const {
   json_object *obj = toJson();
   string res = dump_json(obj);
   json_object_put(obj);
   return res;
}

bool Artifact::deserialize(const string &s) {
   json_object *obj = parse_json(s);
   if (obj == NULL) {
      return false;
   }
   bool res = fromJson(obj);
   json_object_put(obj);
   return res;
}
