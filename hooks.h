/*
   syncREate hooks.h
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

#ifndef __SYNC_HOOKS_H
#define __SYNC_HOOKS_H

#include <stdint.h>
#include <pthread.h>
#include <string>
#include <map>
#include <json-c/json.h>

#include "utils.h"
#include "host_tool.h"
#include "sync_controller.h"

using namespace std;

class HookDispatcher;

/**
 * An EventExtractor turns one host event into the arguments of a push
 * operation. It returns false when the event is of no interest.
 */
typedef bool (*EventExtractor)(const HostEvent &ev, HookDispatcher *hd, json_object *args,
                               json_object *kwargs, string &collapse_key);

struct HookEntry {
   HostEventKind kind;
   const char *op;
   EventExtractor extract;
};

/**
 * HookDispatcher
 * Receives host events, possibly on any host thread, and turns each into
 * exactly one queued command. Nothing here calls back into the host.
 */
class HookDispatcher {
public:
   HookDispatcher(SyncController *sc);
   ~HookDispatcher();

   void notify(const HostEvent &ev);

   SyncController *getController() {return sc;};

   /**
    * cacheDecompiledComments remembers the last comment set pushed for a function
    * @return false if cmts is the same set as last time
    */
   bool cacheDecompiledComments(uint64_t func_addr, const map<uint64_t,string> &cmts);

private:
   void stateChange(const char *op, json_object *args, json_object *kwargs, const string &collapse_key);
   void dispatch(const HookEntry &entry, const HostEvent &ev);
   void viewRefreshed(const HostEvent &ev);

   static const HookEntry hook_table[];

   SyncController *sc;
   bool update_working;
   map<uint64_t,map<uint64_t,string> > cmt_cache;
   pthread_mutex_t cache_mutex;
};

#endif
