/*
   syncREate activity.cpp
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
#include <time.h>
#include <string>
#include <vector>
#include <map>
#include <algorithm>

#include "utils.h"
#include "activity.h"
#include "sync_controller.h"

static bool newest_first(const FunctionActivity &a, const FunctionActivity &b) {
   if (a.last_change != b.last_change) {
      return a.last_change > b.last_change;
   }
   return a.addr < b.addr;
}

vector<FunctionActivity> collectFunctionActivity(Client *client, HostTool *host) {
   map<uint64_t,FunctionActivity> latest;
   vector<string> users = client->users();
   for (vector<string>::iterator u = users.begin(); u != users.end(); u++) {
      State s;
      try {
         s = client->getState(*u);
      } catch (NotFoundException &e) {
         log(LDEBUG, "%s\n", e.getMessage().c_str());
         continue;
      }
      const map<uint64_t,Function> &funcs = s.getFunctions();
      for (map<uint64_t,Function>::const_iterator f = funcs.begin(); f != funcs.end(); f++) {
         if (f->second.last_change == NEVER_CHANGED) {
            continue;
         }
         map<uint64_t,FunctionActivity>::iterator cur = latest.find(f->first);
         if (cur != latest.end() && cur->second.last_change >= f->second.last_change) {
            continue;
         }
         FunctionActivity &a = latest[f->first];
         a.addr = f->first;
         a.local_name = f->second.name;
         a.user = *u;
         a.last_change = f->second.last_change;
      }
   }

   State master;
   if (host == NULL) {
      master = client->getState();
   }
   vector<FunctionActivity> res;
   for (map<uint64_t,FunctionActivity>::iterator i = latest.begin(); i != latest.end(); i++) {
      string name;
      if (host != NULL) {
         if (host->getFunctionName(i->first, name)) {
            i->second.local_name = name;
         }
      }
      else {
         try {
            i->second.local_name = master.getFunction(i->first).name;
         } catch (NotFoundException &e) {
            //never named locally, keep the other user's name
         }
      }
      res.push_back(i->second);
   }
   sort(res.begin(), res.end(), newest_first);
   return res;
}

string friendlyDatetime(int64_t then, time_t now) {
   bool ago = then <= (int64_t)now;
   int64_t diff = ago ? (int64_t)now - then : then - (int64_t)now;
   char buf[64];
   if (diff >= 24 * 60 * 60) {
      snprintf(buf, sizeof(buf), "%lld days", (long long)(diff / (24 * 60 * 60)));
   }
   else if (diff >= 60 * 60) {
      snprintf(buf, sizeof(buf), "%lld hours", (long long)(diff / (60 * 60)));
   }
   else if (diff >= 60) {
      snprintf(buf, sizeof(buf), "%lld minutes", (long long)(diff / 60));
   }
   else {
      snprintf(buf, sizeof(buf), "%lld seconds", (long long)diff);
   }
   string res = buf;
   res += ago ? " ago" : " in the future";
   return res;
}

void ActivityTable::reload(SyncController *sc) {
   if (closed) {
      throw SurfaceClosedException("activity table has been closed");
   }
   if (!sc->isConnected()) {
      rows.clear();
      return;
   }
   rows = collectFunctionActivity(sc->getClient(), sc->getHost());
}

string ActivityTable::render(time_t now) {
   string res;
   char line[512];
   for (vector<FunctionActivity>::iterator r = rows.begin(); r != rows.end(); r++) {
      snprintf(line, sizeof(line), "%-16s %-32s %-16s %s\n", ("0x" + formatAddr(r->addr)).c_str(),
               r->local_name.c_str(), r->user.c_str(), friendlyDatetime(r->last_change, now).c_str());
      res += line;
   }
   return res;
}
