/*
   syncREate activity.h
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

#ifndef __SYNC_ACTIVITY_H
#define __SYNC_ACTIVITY_H

#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>

#include "utils.h"
#include "client.h"
#include "host_tool.h"

using namespace std;

struct FunctionActivity {
   uint64_t addr;
   string local_name;
   string user;
   int64_t last_change;
};

/**
 * collectFunctionActivity finds, for every function any user has changed,
 * the most recent change across all users. Newest first.
 * @param client a connected client
 * @param host used for the local function names, may be NULL in which case
 *        the master user's state supplies them
 */
vector<FunctionActivity> collectFunctionActivity(Client *client, HostTool *host = NULL);

//"5 minutes ago", "2 days in the future"
string friendlyDatetime(int64_t then, time_t now);

/**
 * ActivityTable
 * Info surface listing recent function activity
 */
class ActivityTable : public InfoSurface {
public:
   ActivityTable() : closed(false) {};

   void reload(SyncController *sc);
   void close() {closed = true;};

   const vector<FunctionActivity> &getRows() {return rows;};
   string render(time_t now);

private:
   vector<FunctionActivity> rows;
   bool closed;
};

#endif
