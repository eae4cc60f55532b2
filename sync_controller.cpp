/*
   syncREate sync_controller.cpp
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
#include <string.h>
#include <ctype.h>
#include <unistd.h>
#include <time.h>
#include <pthread.h>
#include <string>
#include <vector>
#include <map>
#include <json-c/json.h>

#include "utils.h"
#include "sync_controller.h"

map<string,TaskHandler> *SyncController::handlers;

static json_object *required_arg(const UpdateTask &task, size_t i) {
   json_object *a = task.arg(i);
   if (a == NULL) {
      throw SyncException(task.getOp() + ": missing argument");
   }
   return a;
}

static uint64_t addr_arg(const UpdateTask &task, size_t i) {
   return (uint64_t)json_object_get_int64(required_arg(task, i));
}

static int64_t int_arg(const UpdateTask &task, size_t i) {
   return json_object_get_int64(required_arg(task, i));
}

static string str_arg(const UpdateTask &task, size_t i) {
   json_object *a = required_arg(task, i);
   return string(json_object_get_string(a), json_object_get_string_len(a));
}

static bool bool_kwarg(const UpdateTask &task, const char *key) {
   json_object *k = task.kwarg(key);
   return k != NULL && json_object_get_boolean(k);
}

static string str_kwarg(const UpdateTask &task, const char *key) {
   json_object *k = task.kwarg(key);
   if (k == NULL || !json_object_is_type(k, json_type_string)) {
      return "";
   }
   return string(json_object_get_string(k), json_object_get_string_len(k));
}

static json_object *user_kwargs(const string &user) {
   json_object *kw = json_object_new_object();
   append_json_string_val(kw, "user", user);
   return kw;
}

//true if one of structs is named as a whole identifier inside type
static bool typeReferencesStruct(const string &type, const vector<Struct> &structs) {
   for (vector<Struct>::const_iterator s = structs.begin(); s != structs.end(); s++) {
      const string &name = s->name;
      for (size_t pos = type.find(name); pos != string::npos; pos = type.find(name, pos + 1)) {
         size_t end = pos + name.length();
         bool left = pos == 0 || !(isalnum((unsigned char)type[pos - 1]) || type[pos - 1] == '_');
         bool right = end == type.length() || !(isalnum((unsigned char)type[end]) || type[end] == '_');
         if (left && right) {
            return true;
         }
      }
   }
   return false;
}

SyncController::SyncController(HostTool *host, json_object *conf) {
   if (handlers == NULL) {
      init_handlers();
   }
   this->host = host;
   api_count = 0;
   pthread_mutex_init(&api_mutex, NULL);
   pthread_mutex_init(&states_mutex, NULL);
   info = NULL;
   last_info_reload = 0;
   pull_interval = getIntOption(conf, "PULL_INTERVAL", DEFAULT_PULL_INTERVAL);
   tick_interval = getIntOption(conf, "TICK_INTERVAL", DEFAULT_TICK_INTERVAL);
   info_interval = getIntOption(conf, "INFO_RELOAD_INTERVAL", DEFAULT_INFO_RELOAD_INTERVAL);
   if (tick_interval < 1) {
      tick_interval = 1;
   }
   running = false;
   done = false;
}

SyncController::~SyncController() {
   stop();
   for (map<uint64_t,UpdateTaskState*>::iterator i = update_states.begin(); i != update_states.end(); i++) {
      delete i->second;
   }
   pthread_mutex_destroy(&api_mutex);
   pthread_mutex_destroy(&states_mutex);
}

void SyncController::init_handlers() {
   handlers = new map<string,TaskHandler>;
   (*handlers)[OP_PUSH_FUNCTION_NAME] = task_push_function_name;
   (*handlers)[OP_PUSH_STACK_VARIABLE] = task_push_stack_variable;
   (*handlers)[OP_PUSH_COMMENT] = task_push_comment;
   (*handlers)[OP_PUSH_COMMENTS] = task_push_comments;
   (*handlers)[OP_PUSH_STRUCT] = task_push_struct;
   (*handlers)[OP_FILL_FUNCTION] = task_fill_function;
   (*handlers)[OP_FILL_STRUCTS] = task_fill_structs;
   (*handlers)[OP_APPLY_FUNCTION_NAME] = task_apply_function_name;
   (*handlers)[OP_APPLY_COMMENT] = task_apply_comment;
   (*handlers)[OP_APPLY_STACK_VAR_NAME] = task_apply_stack_variable_name;
   (*handlers)[OP_APPLY_STACK_VAR_TYPE] = task_apply_stack_variable_type;
}

vector<ConnectionWarning> SyncController::connect(const string &user, const string &repoPath,
                                                  bool initRepo, const string &remoteUrl) {
   string hash = host ? host->currentBinaryHash() : "";
   //the loop thread must not see the old repository go away
   bool was_running = running;
   stop();
   vector<ConnectionWarning> warnings;
   try {
      warnings = client.connect(user, repoPath, hash, initRepo, remoteUrl);
   } catch (SyncException &e) {
      if (was_running) {
         start();
      }
      throw;
   }
   if (was_running) {
      start();
   }
   for (vector<ConnectionWarning>::iterator w = warnings.begin(); w != warnings.end(); w++) {
      log(LWARNING, "%s\n", connectionWarningText(*w));
   }
   return warnings;
}

bool SyncController::isConnected() {
   return client.isConnected();
}

SyncStatus SyncController::status() {
   if (!client.isConnected()) {
      return SYNC_DISCONNECTED;
   }
   return client.hasRemote() ? SYNC_CONNECTED : SYNC_CONNECTED_NO_REMOTE;
}

string SyncController::statusString() {
   switch (status()) {
      case SYNC_CONNECTED:
         return "Connected as " + client.getMasterUser();
      case SYNC_CONNECTED_NO_REMOTE:
         return "Connected as " + client.getMasterUser() + " (no remote)";
      case SYNC_DISCONNECTED:
         break;
   }
   return "Disconnected";
}

vector<string> SyncController::users() {
   return client.users();
}

/**
 * run is the background loop: pull when due, drain one queued command
 * and reload the info surface, once per tick
 */
void *SyncController::run(void *arg) {
   SyncController *sc = (SyncController*)arg;
   log(LINFO, "sync loop running...\n");
   while (!sc->done) {
      sc->tick(time(NULL));
      sleep(sc->tick_interval);
   }
   log(LINFO, "sync loop has ended\n");
   return NULL;
}

bool SyncController::start() {
   if (running) {
      return true;
   }
   done = false;
   if (pthread_create(&tid, NULL, run, (void*)this) != 0) {
      log(LERROR, "unable to start the sync loop\n");
      return false;
   }
   running = true;
   return true;
}

void SyncController::stop() {
   if (running) {
      done = true;
      pthread_join(tid, NULL);
      running = false;
   }
}

void SyncController::tick(time_t now) {
   if (client.isConnected() && client.hasRemote() && now - client.getLastPullAttempt() >= pull_interval) {
      client.pull(now);
   }
   commands.evalOne(this);
   if (info != NULL && now - last_info_reload >= info_interval) {
      last_info_reload = now;
      try {
         info->reload(this);
      } catch (SurfaceClosedException &e) {
         log(LDEBUG, "info surface closed: %s\n", e.getMessage().c_str());
         info = NULL;
      }
   }
}

void SyncController::setInfoSurface(InfoSurface *surface) {
   info = surface;
   last_info_reload = 0;
}

void SyncController::incApiCount() {
   pthread_mutex_lock(&api_mutex);
   api_count++;
   pthread_mutex_unlock(&api_mutex);
}

void SyncController::decApiCount() {
   pthread_mutex_lock(&api_mutex);
   if (api_count > 0) {
      api_count--;
   }
   pthread_mutex_unlock(&api_mutex);
}

int SyncController::getApiCount() {
   pthread_mutex_lock(&api_mutex);
   int res = api_count;
   pthread_mutex_unlock(&api_mutex);
   return res;
}

bool SyncController::consumeApiCount() {
   pthread_mutex_lock(&api_mutex);
   bool res = api_count > 0;
   if (res) {
      api_count--;
   }
   else {
      api_count = 0;
   }
   pthread_mutex_unlock(&api_mutex);
   return res;
}

void SyncController::runTask(const UpdateTask &task) {
   map<string,TaskHandler>::iterator i = handlers->find(task.getOp());
   if (i == handlers->end()) {
      throw SyncException("unknown operation " + task.getOp());
   }
   TaskHandler h = i->second;
   (*h)(task, this);
}

void SyncController::schedule(const UpdateTask &task, const string &collapse_key) {
   commands.add(task, collapse_key);
}

UpdateTaskState *SyncController::updateState(uint64_t func_addr) {
   pthread_mutex_lock(&states_mutex);
   UpdateTaskState *&res = update_states[func_addr];
   if (res == NULL) {
      res = new UpdateTaskState();
   }
   UpdateTaskState *ts = res;
   pthread_mutex_unlock(&states_mutex);
   return ts;
}

int SyncController::doNeededUpdates(uint64_t func_addr) {
   return updateState(func_addr)->doNeededUpdates(this);
}

UpdateTask SyncController::makeTask(const char *op, json_object *args, json_object *kwargs) {
   return UpdateTask(op, args, kwargs);
}

State SyncController::readState(const string &user) {
   return client.getState(user);
}

bool SyncController::pullFunction(uint64_t addr, const string &user, Function &f) {
   try {
      f = readState(user).getFunction(addr);
      return true;
   } catch (NotFoundException &e) {
      log(LDEBUG, "%s\n", e.getMessage().c_str());
   }
   return false;
}

StackVarMap SyncController::pullStackVariables(uint64_t func_addr, const string &user) {
   try {
      return readState(user).getStackVariables(func_addr);
   } catch (NotFoundException &e) {
      log(LDEBUG, "%s\n", e.getMessage().c_str());
   }
   return StackVarMap();
}

map<uint64_t,Comment> SyncController::pullComments(uint64_t func_addr, const string &user) {
   try {
      return readState(user).getComments(func_addr);
   } catch (NotFoundException &e) {
      log(LDEBUG, "%s\n", e.getMessage().c_str());
   }
   return map<uint64_t,Comment>();
}

vector<Struct> SyncController::pullStructs(const string &user) {
   try {
      return readState(user).getStructs();
   } catch (NotFoundException &e) {
      log(LDEBUG, "%s\n", e.getMessage().c_str());
   }
   return vector<Struct>();
}

void SyncController::afterPush() {
   if (client.hasRemote()) {
      client.push();
   }
}

void SyncController::pushFunctionName(uint64_t addr, const string &name, bool api_set) {
   {
      StateCtx ctx(&client);
      ctx->setFunction(Function(addr, name), !api_set);
      ctx.commit();
   }
   afterPush();
}

void SyncController::pushStackVariable(uint64_t func_addr, int64_t offset, const string &name, const string &type,
                                       uint32_t size, bool api_set) {
   StackOffsetType ot = host ? host->offsetType() : OFFSET_IDA;
   {
      StateCtx ctx(&client);
      ctx->setStackVariable(StackVariable(offset, ot, name, type, size, func_addr), offset, func_addr, !api_set);
      ctx.commit();
   }
   afterPush();
}

void SyncController::pushComment(uint64_t func_addr, uint64_t addr, const string &text, bool decompiled, bool api_set) {
   {
      StateCtx ctx(&client);
      ctx->setComment(Comment(func_addr, addr, text, decompiled), !api_set);
      ctx.commit();
   }
   afterPush();
}

void SyncController::pushComments(uint64_t func_addr, const map<uint64_t,string> &cmts, bool decompiled, bool api_set) {
   {
      StateCtx ctx(&client);
      for (map<uint64_t,string>::const_iterator i = cmts.begin(); i != cmts.end(); i++) {
         ctx->setComment(Comment(func_addr, i->first, i->second, decompiled), !api_set);
      }
      ctx.commit();
   }
   afterPush();
}

void SyncController::pushStruct(const Struct &s, const string &old_name, bool api_set) {
   {
      StateCtx ctx(&client);
      ctx->setStruct(s, old_name, !api_set);
      ctx.commit();
   }
   afterPush();
}

void SyncController::removeAllComments(uint64_t func_addr) {
   {
      StateCtx ctx(&client);
      map<uint64_t,Comment> cmts = ctx->getComments(func_addr);
      for (map<uint64_t,Comment>::iterator i = cmts.begin(); i != cmts.end(); i++) {
         ctx->removeComment(i->first);
      }
      ctx.commit();
   }
   afterPush();
}

int SyncController::fillFunction(uint64_t func_addr, const string &user) {
   if (host == NULL) {
      throw SyncException("no host tool attached");
   }
   State master = client.getState();
   const string &self = client.getMasterUser();
   string u = user.length() > 0 ? user : self;
   State theirs = master;
   if (u != self) {
      try {
         theirs = client.getState(u);
      } catch (NotFoundException &e) {
         log(LDEBUG, "%s\n", e.getMessage().c_str());
         return -1;
      }
   }

   uint64_t start;
   if (!host->getFunctionAt(func_addr, &start) || start != func_addr) {
      log(LERROR, "host error on sync for '%s' on function 0x%s\n", u.c_str(), formatAddr(func_addr).c_str());
      return -1;
   }

   //the master state holds whatever was last applied or edited here
   if (u != self && master.compareFunction(func_addr, theirs)) {
      log(LINFO2, "no change on sync for '%s' on function 0x%s\n", u.c_str(), formatAddr(func_addr).c_str());
      return 0;
   }

   vector<UpdateTask> applies;

   // === function name === //
   try {
      const Function &f = theirs.getFunction(func_addr);
      string cur;
      if (f.name.length() > 0 && (!host->getFunctionName(func_addr, cur) || cur != f.name)) {
         json_object *args = json_object_new_array();
         json_object_array_add(args, json_object_new_int64((int64_t)func_addr));
         json_object_array_add(args, json_object_new_string(f.name.c_str()));
         applies.push_back(makeTask(OP_APPLY_FUNCTION_NAME, args));
      }
   } catch (NotFoundException &e) {
      log(LDEBUG, "%s\n", e.getMessage().c_str());
   }

   // === comments === //
   map<uint64_t,Comment> cmts = theirs.getComments(func_addr);
   for (map<uint64_t,Comment>::iterator c = cmts.begin(); c != cmts.end(); c++) {
      string cur;
      if (!host->getComment(c->first, c->second.decompiled, cur) || cur != c->second.comment) {
         json_object *args = json_object_new_array();
         json_object_array_add(args, json_object_new_int64((int64_t)c->first));
         json_object_array_add(args, json_object_new_string(c->second.comment.c_str()));
         json_object *kw = json_object_new_object();
         append_json_bool_val(kw, "decompiled", c->second.decompiled);
         applies.push_back(makeTask(OP_APPLY_COMMENT, args, kw));
      }
   }

   // === stack variables === //
   StackVarMap frame;
   if (!host->getStackFrame(func_addr, frame) || frame.empty()) {
      log(LDEBUG, "function 0x%s has no stack frame, skipping stack variables\n", formatAddr(func_addr).c_str());
   }
   else {
      StackVarMap vars;
      try {
         vars = theirs.getStackVariables(func_addr);
      } catch (NotFoundException &e) {
         log(LDEBUG, "%s\n", e.getMessage().c_str());
      }
      for (StackVarMap::iterator v = vars.begin(); v != vars.end(); v++) {
         int64_t offset;
         try {
            offset = v->second.getOffset(host->offsetType());
         } catch (UnsupportedOffsetConversion &e) {
            log(LWARNING, "%s\n", e.getMessage().c_str());
            continue;
         }
         //only variables the host already has
         StackVarMap::iterator hv = frame.find(offset);
         if (hv == frame.end()) {
            continue;
         }
         if (v->second.name.length() > 0 && v->second.name != hv->second.name) {
            json_object *args = json_object_new_array();
            json_object_array_add(args, json_object_new_int64((int64_t)func_addr));
            json_object_array_add(args, json_object_new_int64(offset));
            json_object_array_add(args, json_object_new_string(v->second.name.c_str()));
            applies.push_back(makeTask(OP_APPLY_STACK_VAR_NAME, args));
         }
         if (v->second.type.length() > 0 && v->second.type != hv->second.type) {
            json_object *args = json_object_new_array();
            json_object_array_add(args, json_object_new_int64((int64_t)func_addr));
            json_object_array_add(args, json_object_new_int64(offset));
            json_object_array_add(args, json_object_new_string(v->second.type.c_str()));
            applies.push_back(makeTask(OP_APPLY_STACK_VAR_TYPE, args, user_kwargs(u)));
         }
      }
   }

   for (vector<UpdateTask>::iterator t = applies.begin(); t != applies.end(); t++) {
      runTaskSafely(this, *t);
   }

   host->refreshView(func_addr);
   if (applies.size() > 0) {
      log(LINFO, "new data synced for '%s' on function 0x%s\n", u.c_str(), formatAddr(func_addr).c_str());
   }
   return (int)applies.size();
}

bool SyncController::fillStructs(const string &user) {
   if (host == NULL) {
      throw SyncException("no host tool attached");
   }
   vector<Struct> structs = pullStructs(user);
   if (structs.size() == 0) {
      log(LINFO, "user %s has no structs to sync\n", user.c_str());
      return true;
   }

   vector<Struct> changed;
   for (vector<Struct>::iterator s = structs.begin(); s != structs.end(); s++) {
      Struct cur;
      if (host->getStruct(s->name, cur) && cur == *s) {
         log(LDEBUG, "struct %s is unchanged\n", s->name.c_str());
         continue;
      }
      changed.push_back(*s);
      incApiCount();
      if (!host->setStruct(*s)) {
         decApiCount();
         log(LWARNING, "failed to create struct %s\n", s->name.c_str());
      }
   }

   //member types may refer to any of the structs, so they go last
   bool all_typed = true;
   for (vector<Struct>::iterator s = changed.begin(); s != changed.end(); s++) {
      incApiCount();
      if (!host->setStructMemberTypes(*s)) {
         decApiCount();
         log(LWARNING, "failed to type the members of struct %s\n", s->name.c_str());
         all_typed = false;
      }
   }
   return all_typed;
}

void SyncController::syncAll(const string &user) {
   client.syncStates(user);
   State merged = client.getState();
   const map<uint64_t,Function> &funcs = merged.getFunctions();
   for (map<uint64_t,Function>::const_iterator f = funcs.begin(); f != funcs.end(); f++) {
      queueFillFunction(f->first, client.getMasterUser());
   }
   log(LINFO1, "queued %d functions for sync\n", (int)funcs.size());
}

static UpdateTask fillFunctionTask(uint64_t func_addr, const string &user) {
   json_object *args = json_object_new_array();
   json_object_array_add(args, json_object_new_int64((int64_t)func_addr));
   return SyncController::makeTask(OP_FILL_FUNCTION, args, user_kwargs(user));
}

bool SyncController::queueFillFunction(uint64_t func_addr, const string &user) {
   return updateState(func_addr)->addUpdateTask(fillFunctionTask(func_addr, user));
}

bool SyncController::toggleAutoSync(uint64_t func_addr, const string &user) {
   bool enabled = updateState(func_addr)->toggleAutoSyncTask(fillFunctionTask(func_addr, user));
   log(LINFO, "auto sync of 0x%s from %s %s\n", formatAddr(func_addr).c_str(), user.c_str(), enabled ? "enabled" : "disabled");
   return enabled;
}

string SyncController::getDefaultTypeStr(uint32_t size) {
   switch (size) {
      case 1:
         return "unsigned char";
      case 2:
         return "unsigned short";
      case 4:
         return "unsigned int";
      case 8:
         return "unsigned long long";
   }
   return "unknown";
}

void SyncController::applyFunctionName(uint64_t addr, const string &name) {
   incApiCount();
   if (!host->setFunctionName(addr, name)) {
      decApiCount();
      throw SyncException("unable to rename function 0x" + formatAddr(addr) + " to " + name);
   }
}

void SyncController::applyComment(uint64_t addr, const string &text, bool decompiled) {
   incApiCount();
   if (!host->setComment(addr, text, decompiled)) {
      decApiCount();
      throw SyncException("unable to set comment at 0x" + formatAddr(addr));
   }
}

void SyncController::applyStackVariableName(uint64_t func_addr, int64_t offset, const string &name) {
   incApiCount();
   if (!host->renameStackMember(func_addr, offset, name)) {
      decApiCount();
      throw SyncException("unable to rename stack variable " + formatOffset(offset) + " in 0x" + formatAddr(func_addr));
   }
}

void SyncController::applyStackVariableType(uint64_t func_addr, int64_t offset, const string &type, const string &user) {
   if (!host->isKnownType(type)) {
      //it may be one of the user's own structs
      if (typeReferencesStruct(type, pullStructs(user))) {
         log(LINFO2, "type %s refers to a struct of %s, filling structs\n", type.c_str(), user.c_str());
         runTask(makeTask(OP_FILL_STRUCTS, json_object_new_array(), user_kwargs(user)));
      }
      if (!host->isKnownType(type)) {
         log(LWARNING, "failed to parse stack variable type at offset %s with type %s on function 0x%s\n",
             formatOffset(offset).c_str(), type.c_str(), formatAddr(func_addr).c_str());
         return;
      }
   }
   incApiCount();
   if (!host->setMemberType(func_addr, offset, type)) {
      decApiCount();
      throw TypeConversionException("unable to set type " + type + " at offset " + formatOffset(offset) +
                                    " in 0x" + formatAddr(func_addr));
   }
}

void SyncController::task_push_function_name(const UpdateTask &task, SyncController *sc) {
   sc->pushFunctionName(addr_arg(task, 0), str_arg(task, 1), bool_kwarg(task, "api_set"));
}

void SyncController::task_push_stack_variable(const UpdateTask &task, SyncController *sc) {
   sc->pushStackVariable(addr_arg(task, 0), int_arg(task, 1), str_arg(task, 2), str_arg(task, 3),
                         (uint32_t)int_arg(task, 4), bool_kwarg(task, "api_set"));
}

void SyncController::task_push_comment(const UpdateTask &task, SyncController *sc) {
   sc->pushComment(addr_arg(task, 0), addr_arg(task, 1), str_arg(task, 2),
                   bool_kwarg(task, "decompiled"), bool_kwarg(task, "api_set"));
}

void SyncController::task_push_comments(const UpdateTask &task, SyncController *sc) {
   json_object *obj = required_arg(task, 1);
   map<uint64_t,string> cmts;
   json_object_object_foreach(obj, k, v) {
      uint64_t addr;
      if (!parseAddr(k, &addr)) {
         throw SyncException(task.getOp() + ": bad comment address " + k);
      }
      cmts[addr] = json_object_get_string(v);
   }
   sc->pushComments(addr_arg(task, 0), cmts, bool_kwarg(task, "decompiled"), bool_kwarg(task, "api_set"));
}

void SyncController::task_push_struct(const UpdateTask &task, SyncController *sc) {
   //a NULL struct is a deletion of old_name
   json_object *sj = task.arg(0);
   Struct s;
   if (sj != NULL && !s.fromJson(sj)) {
      throw SyncException(task.getOp() + ": unparsable struct " + json_text(sj));
   }
   sc->pushStruct(s, str_arg(task, 1), bool_kwarg(task, "api_set"));
}

void SyncController::task_fill_function(const UpdateTask &task, SyncController *sc) {
   sc->fillFunction(addr_arg(task, 0), str_kwarg(task, "user"));
}

void SyncController::task_fill_structs(const UpdateTask &task, SyncController *sc) {
   sc->fillStructs(str_kwarg(task, "user"));
}

void SyncController::task_apply_function_name(const UpdateTask &task, SyncController *sc) {
   sc->applyFunctionName(addr_arg(task, 0), str_arg(task, 1));
}

void SyncController::task_apply_comment(const UpdateTask &task, SyncController *sc) {
   sc->applyComment(addr_arg(task, 0), str_arg(task, 1), bool_kwarg(task, "decompiled"));
}

void SyncController::task_apply_stack_variable_name(const UpdateTask &task, SyncController *sc) {
   sc->applyStackVariableName(addr_arg(task, 0), int_arg(task, 1), str_arg(task, 2));
}

void SyncController::task_apply_stack_variable_type(const UpdateTask &task, SyncController *sc) {
   sc->applyStackVariableType(addr_arg(task, 0), int_arg(task, 1), str_arg(task, 2), str_kwarg(task, "user"));
}
