/*
   syncREate artifact.h
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

#ifndef __SYNC_ARTIFACT_H
#define __SYNC_ARTIFACT_H

#include <stdint.h>
#include <string>
#include <vector>
#include <map>
#include <json-c/json.h>

#include "utils.h"

using namespace std;

/**
 * Artifact
 * Base of every piece of analysis that gets synchronized between users
 * (function names, stack variables, comments, structs). Artifacts are
 * plain values: equality compares content only, never last_change.
 */
class Artifact {
public:
   Artifact(int64_t last_change = NEVER_CHANGED) : last_change(last_change) {};
   virtual ~Artifact() {};

   /**
    * key returns the stable key this artifact is stored under on disk
    * (hex address, hex offset or name)
    */
   virtual string key() const = 0;

   /**
    * toJson builds a new json object holding every field, caller owns it
    */
   virtual json_object *toJson() const = 0;

   /**
    * fromJson fills this artifact from a json object produced by toJson
    * @return false if a required field is missing or has the wrong type
    */
   virtual bool fromJson(json_object *obj) = 0;

   string serialize() const;
   bool deserialize(const string &s);

   int64_t last_change;
};

//render a json object the way every file in a sync repo is written
string dump_json(json_object *obj);

//parse a file's contents, NULL if it isn't a json object
json_object *parse_json(const string &s);

/**
 * dump_many builds a json object keyed by each artifact's stable key. Items
 * come out in map order so that dumping unchanged data is byte identical.
 */
template <class K, class T>
json_object *dump_many(const map<K,T> &items) {
   json_object *res = json_object_new_object();
   for (typename map<K,T>::const_iterator i = items.begin(); i != items.end(); i++) {
      json_object_object_add(res, i->second.key().c_str(), i->second.toJson());
   }
   return res;
}

/**
 * load_many parses every value of a json object produced by dump_many.
 * A value that fails to parse is logged and skipped, the rest still load.
 */
template <class T>
vector<T> load_many(json_object *obj) {
   vector<T> res;
   if (obj == NULL || !json_object_is_type(obj, json_type_object)) {
      return res;
   }
   json_object_object_foreach(obj, k, v) {
      T item;
      if (item.fromJson(v)) {
         res.push_back(item);
      }
      else {
         log(LWARNING, "skipping unparsable artifact %s: %s\n", k, json_text(v));
      }
   }
   return res;
}

#endif
