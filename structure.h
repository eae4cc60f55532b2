/*
   syncREate structure.h
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

#ifndef __SYNC_STRUCTURE_H
#define __SYNC_STRUCTURE_H

#include <stdint.h>
#include <string>
#include <map>
#include <json-c/json.h>

#include "artifact.h"

using namespace std;

struct StructMember {
   StructMember(const string &name = "", int64_t offset = 0, const string &type = "", uint32_t size = 0);
   string key() const;
   json_object *toJson() const;
   bool fromJson(json_object *obj);
   bool operator==(const StructMember &other) const;
   bool operator!=(const StructMember &other) const {return !(*this == other);};

   string name;
   int64_t offset;
   string type;
   uint32_t size;
};

/**
 * Struct
 * A user defined structure type. Members are keyed by byte offset. A
 * struct is always synchronized as a whole: renames and member edits
 * replace the entire definition.
 *
 * A Struct with an empty name marks a deleted struct when pushed.
 */
class Struct : public Artifact {
public:
   Struct(const string &name = "", uint32_t size = 0, int64_t last_change = NEVER_CHANGED);

   string key() const;
   json_object *toJson() const;
   bool fromJson(json_object *obj);

   void addMember(const string &name, int64_t offset, const string &type, uint32_t size);
   bool isDeleted() const {return name.length() == 0;};

   bool operator==(const Struct &other) const;
   bool operator!=(const Struct &other) const {return !(*this == other);};

   string name;
   uint32_t size;
   map<int64_t,StructMember> members;
};

#endif
