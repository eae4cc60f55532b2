/*
   syncREate function.h
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

#ifndef __SYNC_FUNCTION_H
#define __SYNC_FUNCTION_H

#include <stdint.h>
#include <string>
#include <json-c/json.h>

#include "artifact.h"

using namespace std;

/**
 * Function
 * A function's user assigned name, keyed by its start address
 */
class Function : public Artifact {
public:
   Function(uint64_t addr = 0, const string &name = "", int64_t last_change = NEVER_CHANGED);

   string key() const;
   json_object *toJson() const;
   bool fromJson(json_object *obj);

   bool operator==(const Function &other) const;
   bool operator!=(const Function &other) const {return !(*this == other);};

   uint64_t addr;
   string name;
};

#endif
