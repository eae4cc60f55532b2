/*
   syncREate hooks.cpp
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

#include <time.h>
#include <string.h>
#include <pthread.h>
#include <string>
#include <map>
#include <json-c/json.h>

#include "utils.h"
#include "hooks.h"

static bool function_renamed(const HostEvent &ev, HookDispatcher *hd, json_object *args,
                             json_object *kwargs, string &collapse_key) {
   if (ev.name.length() == 0) {
      return false;
   }
   json_object_array_add(args, json_object_new_int64((int64_t)ev.addr));
   json_object_array_add(args, json_object_new_string(ev.name.c_str()));
   return true;
}

static bool stack_member_changed(const HostEvent &ev, HookDispatcher *hd, json_object *args,
                                 json_object *kwargs, string &collapse_key) {
   //untyped members get a type from their size
   string type = ev.type.length() > 0 ? ev.type : SyncController::getDefaultTypeStr(ev.size);
   json_object_array_add(args, json_object_new_int64((int64_t)ev.func_addr));
   json_object_array_add(args, json_object_new_int64(ev.offset));
   json_object_array_add(args, json_object_new_string(ev.name.c_str()));
   json_object_array_add(args, json_object_new_string(type.c_str()));
   json_object_array_add(args, json_object_new_int64(ev.size));
   return true;
}

/**
 * Any change to a struct re-sends the whole definition. Pushes of the same
 * struct collapse in the command queue, so a rename still waiting there is
 * carried into its replacement.
 */
static bool struct_changed(const HostEvent &ev, HookDispatcher *hd, json_object *args,
                           json_object *kwargs, string &collapse_key) {
   const Struct &s = ev.structure;
   bool deleted = ev.kind == EV_STRUCT_DELETED;
   string name = deleted ? (ev.old_name.length() > 0 ? ev.old_name : s.name) : s.name;
   //stack frames show up as structs named $...
   if (name.length() == 0 || name[0] == '$') {
      return false;
   }
   string old_name = ev.old_name.length() > 0 ? ev.old_name : name;

   UpdateTask pending;
   if (hd->getController()->getCommandQueue()->peek(name, pending)) {
      json_object *ps = pending.arg(0);
      json_object *po = pending.arg(1);
      const char *pending_name = ps ? string_from_json(ps, "name") : NULL;
      if (po != NULL && (pending_name == NULL || strcmp(pending_name, json_object_get_string(po)) != 0)) {
         old_name = json_object_get_string(po);
      }
   }

   if (deleted) {
      json_object_array_add(args, NULL);
   }
   else {
      json_object_array_add(args, s.toJson());
   }
   json_object_array_add(args, json_object_new_string(old_name.c_str()));
   collapse_key = name;
   return true;
}

static bool comment_changed(const HostEvent &ev, HookDispatcher *hd, json_object *args,
                            json_object *kwargs, string &collapse_key) {
   if (ev.text.length() == 0) {
      return false;
   }
   json_object_array_add(args, json_object_new_int64((int64_t)ev.func_addr));
   json_object_array_add(args, json_object_new_int64((int64_t)ev.addr));
   json_object_array_add(args, json_object_new_string(ev.text.c_str()));
   append_json_bool_val(kwargs, "decompiled", false);
   return true;
}

static bool decompiled_comments_changed(const HostEvent &ev, HookDispatcher *hd, json_object *args,
                                        json_object *kwargs, string &collapse_key) {
   //never push the same set twice
   if (ev.comments.size() == 0 || !hd->cacheDecompiledComments(ev.func_addr, ev.comments)) {
      return false;
   }
   json_object *cmts = json_object_new_object();
   for (map<uint64_t,string>::const_iterator i = ev.comments.begin(); i != ev.comments.end(); i++) {
      json_object_object_add(cmts, formatAddr(i->first).c_str(), json_object_new_string(i->second.c_str()));
   }
   json_object_array_add(args, json_object_new_int64((int64_t)ev.func_addr));
   json_object_array_add(args, cmts);
   append_json_bool_val(kwargs, "decompiled", true);
   return true;
}

const HookEntry HookDispatcher::hook_table[] = {
   {EV_FUNCTION_RENAMED, OP_PUSH_FUNCTION_NAME, function_renamed},
   {EV_STACK_MEMBER_RENAMED, OP_PUSH_STACK_VARIABLE, stack_member_changed},
   {EV_STACK_MEMBER_TYPE_CHANGED, OP_PUSH_STACK_VARIABLE, stack_member_changed},
   {EV_STRUCT_CREATED, OP_PUSH_STRUCT, struct_changed},
   {EV_STRUCT_RENAMED, OP_PUSH_STRUCT, struct_changed},
   {EV_STRUCT_MEMBER_CHANGED, OP_PUSH_STRUCT, struct_changed},
   {EV_STRUCT_DELETED, OP_PUSH_STRUCT, struct_changed},
   {EV_COMMENT_CHANGED, OP_PUSH_COMMENT, comment_changed},
   {EV_DECOMPILED_COMMENT_CHANGED, OP_PUSH_COMMENTS, decompiled_comments_changed},
   {EV_VIEW_REFRESHED, OP_PUSH_COMMENTS, decompiled_comments_changed}
};

HookDispatcher::HookDispatcher(SyncController *sc) {
   this->sc = sc;
   update_working = false;
   pthread_mutex_init(&cache_mutex, NULL);
}

HookDispatcher::~HookDispatcher() {
   pthread_mutex_destroy(&cache_mutex);
}

void HookDispatcher::notify(const HostEvent &ev) {
   if (!sc->isConnected()) {
      return;
   }
   if (ev.kind == EV_VIEW_REFRESHED) {
      viewRefreshed(ev);
   }
   for (size_t i = 0; i < sizeof(hook_table) / sizeof(hook_table[0]); i++) {
      if (hook_table[i].kind == ev.kind) {
         dispatch(hook_table[i], ev);
         break;
      }
   }
}

void HookDispatcher::dispatch(const HookEntry &entry, const HostEvent &ev) {
   json_object *args = json_object_new_array();
   json_object *kwargs = json_object_new_object();
   string collapse_key;
   if ((*entry.extract)(ev, this, args, kwargs, collapse_key)) {
      stateChange(entry.op, args, kwargs, collapse_key);
   }
   else {
      json_object_put(args);
      json_object_put(kwargs);
   }
}

/**
 * stateChange queues a push. While the controller has mutations of its
 * own outstanding the event is one of them: it is still recorded, but
 * marked api_set so it never counts as this analyst's edit.
 */
void HookDispatcher::stateChange(const char *op, json_object *args, json_object *kwargs, const string &collapse_key) {
   bool api_set = sc->consumeApiCount();
   append_json_bool_val(kwargs, "api_set", api_set);
   append_json_int64_val(kwargs, "timestamp", (int64_t)time(NULL));
   log(LDEBUG, "queueing %s%s\n", op, api_set ? " (api)" : "");
   sc->schedule(UpdateTask(op, args, kwargs), collapse_key);
}

void HookDispatcher::viewRefreshed(const HostEvent &ev) {
   //applying updates refreshes the view again
   if (!update_working) {
      update_working = true;
      sc->doNeededUpdates(ev.func_addr);
      update_working = false;
   }
}

bool HookDispatcher::cacheDecompiledComments(uint64_t func_addr, const map<uint64_t,string> &cmts) {
   pthread_mutex_lock(&cache_mutex);
   map<uint64_t,map<uint64_t,string> >::iterator i = cmt_cache.find(func_addr);
   bool changed = i == cmt_cache.end() || i->second != cmts;
   if (changed) {
      cmt_cache[func_addr] = cmts;
   }
   pthread_mutex_unlock(&cache_mutex);
   return changed;
}
