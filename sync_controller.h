/*
   syncREate sync_controller.h
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

#ifndef __SYNC_CONTROLLER_H
#define __SYNC_CONTROLLER_H

#include <stdint.h>
#include <time.h>
#include <pthread.h>
#include <string>
#include <vector>
#include <map>
#include <json-c/json.h>

#include "utils.h"
#include "state.h"
#include "client.h"
#include "update_task.h"
#include "host_tool.h"

using namespace std;

//operations and their positional arguments, every push op also takes
//the api_set and timestamp keywords
#define OP_PUSH_FUNCTION_NAME        "push_function_name"        //addr, name
#define OP_PUSH_STACK_VARIABLE       "push_stack_variable"       //func_addr, offset, name, type, size
#define OP_PUSH_COMMENT              "push_comment"              //func_addr, addr, text; decompiled
#define OP_PUSH_COMMENTS             "push_comments"             //func_addr, {addr: text}; decompiled
#define OP_PUSH_STRUCT               "push_struct"               //struct, old_name
#define OP_FILL_FUNCTION             "fill_function"             //func_addr; user
#define OP_FILL_STRUCTS              "fill_structs"              //user
#define OP_APPLY_FUNCTION_NAME       "apply_function_name"       //addr, name
#define OP_APPLY_COMMENT             "apply_comment"             //addr, text; decompiled
#define OP_APPLY_STACK_VAR_NAME      "apply_stack_variable_name" //func_addr, offset, name
#define OP_APPLY_STACK_VAR_TYPE      "apply_stack_variable_type" //func_addr, offset, type; user

#define DEFAULT_PULL_INTERVAL        10
#define DEFAULT_TICK_INTERVAL        1
#define DEFAULT_INFO_RELOAD_INTERVAL 10

enum SyncStatus {
   SYNC_CONNECTED,
   SYNC_CONNECTED_NO_REMOTE,
   SYNC_DISCONNECTED
};

class SyncController;

typedef void (*TaskHandler)(const UpdateTask &task, SyncController *sc);

/**
 * SyncController
 * Ties the Client to the host tool. Local edits arrive as push tasks on the
 * command queue and are written into the master user's state by the
 * background loop. Other users' work reaches the host through fill tasks,
 * which diff a user's state against what the host shows and apply only
 * what differs. Every host mutation made here bumps the api counter first
 * so the resulting host event is not mistaken for a fresh user edit.
 */
class SyncController : public TaskRunner {
public:
   /**
    * @param host the host tool, may be NULL when only the repository is used
    * @param conf parsed configuration, may be NULL
    */
   SyncController(HostTool *host, json_object *conf = NULL);
   ~SyncController();

   /**
    * connect the underlying client, the binary hash comes from the host
    * @return warnings, which are also logged
    */
   vector<ConnectionWarning> connect(const string &user, const string &repoPath,
                                     bool initRepo = false, const string &remoteUrl = "");
   bool isConnected();
   SyncStatus status();
   string statusString();
   vector<string> users();

   Client *getClient() {return &client;};
   HostTool *getHost() {return host;};
   CommandQueue *getCommandQueue() {return &commands;};

   //background loop
   bool start();
   void stop();
   bool isRunning() {return running;};
   void tick(time_t now);
   void setInfoSurface(InfoSurface *surface);

   //api suppression counter
   void incApiCount();
   void decApiCount();
   int getApiCount();

   /**
    * consumeApiCount is called by the hook layer for every observed event
    * @return true if the event was caused by this controller
    */
   bool consumeApiCount();

   //TaskRunner
   void runTask(const UpdateTask &task);

   void schedule(const UpdateTask &task, const string &collapse_key = "");
   UpdateTaskState *updateState(uint64_t func_addr);
   int doNeededUpdates(uint64_t func_addr);

   //pullers, a missing artifact is not an error
   bool pullFunction(uint64_t addr, const string &user, Function &f);
   StackVarMap pullStackVariables(uint64_t func_addr, const string &user);
   map<uint64_t,Comment> pullComments(uint64_t func_addr, const string &user);
   vector<Struct> pullStructs(const string &user);

   //pushers, these write the master user's state
   void pushFunctionName(uint64_t addr, const string &name, bool api_set = false);
   void pushStackVariable(uint64_t func_addr, int64_t offset, const string &name, const string &type,
                          uint32_t size, bool api_set = false);
   void pushComment(uint64_t func_addr, uint64_t addr, const string &text, bool decompiled = false, bool api_set = false);
   void pushComments(uint64_t func_addr, const map<uint64_t,string> &cmts, bool decompiled = false, bool api_set = false);
   void pushStruct(const Struct &s, const string &old_name, bool api_set = false);
   void removeAllComments(uint64_t func_addr);

   /**
    * fillFunction brings the host's view of a function in line with a user's state
    * @param func_addr start of the function
    * @param user whose state to apply, empty for the master user
    * @return the number of changes applied, 0 if nothing differed, -1 on error
    */
   int fillFunction(uint64_t func_addr, const string &user);

   /**
    * fillStructs applies all of a user's structs, skipping those the host
    * already has in identical form
    * @return false if a member type could not be applied
    */
   bool fillStructs(const string &user);

   //merge user's state into ours and queue a fill of every function
   void syncAll(const string &user);

   bool queueFillFunction(uint64_t func_addr, const string &user);
   bool toggleAutoSync(uint64_t func_addr, const string &user);

   static string getDefaultTypeStr(uint32_t size);
   static UpdateTask makeTask(const char *op, json_object *args, json_object *kwargs = NULL);

private:
   State readState(const string &user);
   void applyFunctionName(uint64_t addr, const string &name);
   void applyComment(uint64_t addr, const string &text, bool decompiled);
   void applyStackVariableName(uint64_t func_addr, int64_t offset, const string &name);
   void applyStackVariableType(uint64_t func_addr, int64_t offset, const string &type, const string &user);
   void afterPush();

   static void *run(void *arg);
   static void init_handlers();

   static void task_push_function_name(const UpdateTask &task, SyncController *sc);
   static void task_push_stack_variable(const UpdateTask &task, SyncController *sc);
   static void task_push_comment(const UpdateTask &task, SyncController *sc);
   static void task_push_comments(const UpdateTask &task, SyncController *sc);
   static void task_push_struct(const UpdateTask &task, SyncController *sc);
   static void task_fill_function(const UpdateTask &task, SyncController *sc);
   static void task_fill_structs(const UpdateTask &task, SyncController *sc);
   static void task_apply_function_name(const UpdateTask &task, SyncController *sc);
   static void task_apply_comment(const UpdateTask &task, SyncController *sc);
   static void task_apply_stack_variable_name(const UpdateTask &task, SyncController *sc);
   static void task_apply_stack_variable_type(const UpdateTask &task, SyncController *sc);

   static map<string,TaskHandler> *handlers;

   Client client;
   HostTool *host;
   CommandQueue commands;

   int api_count;
   pthread_mutex_t api_mutex;

   map<uint64_t,UpdateTaskState*> update_states;
   pthread_mutex_t states_mutex;

   InfoSurface *info;
   time_t last_info_reload;
   int pull_interval;
   int tick_interval;
   int info_interval;

   pthread_t tid;
   bool running;
   volatile bool done;
};

#endif
