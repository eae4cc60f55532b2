/*
   syncREate update_task.cpp
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
#include <pthread.h>
#include <exception>
#include <string>
#include <vector>
#include <list>
#include <json-c/json.h>

#include "utils.h"
#include "update_task.h"

UpdateTask::UpdateTask(const string &op, json_object *args, json_object *kwargs) {
   this->op = op;
   this->args = args ? args : json_object_new_array();
   this->kwargs = kwargs ? kwargs : json_object_new_object();
   buildIdentity();
}

//json-c reference counts are not atomic, so a task never shares its arguments
static json_object *copy_json(json_object *src) {
   json_object *dst = NULL;
   if (json_object_deep_copy(src, &dst, NULL) != 0) {
      throw SyncException("unable to copy task arguments");
   }
   return dst;
}

UpdateTask::UpdateTask(const UpdateTask &other) {
   op = other.op;
   args = copy_json(other.args);
   kwargs = copy_json(other.kwargs);
   identity = other.identity;
}

UpdateTask &UpdateTask::operator=(const UpdateTask &other) {
   if (this != &other) {
      json_object *a = copy_json(other.args);
      json_object *k = copy_json(other.kwargs);
      json_object_put(args);
      json_object_put(kwargs);
      args = a;
      kwargs = k;
      op = other.op;
      identity = other.identity;
   }
   return *this;
}

UpdateTask::~UpdateTask() {
   json_object_put(args);
   json_object_put(kwargs);
}

//op plus the plain rendering of every argument except the timestamp
void UpdateTask::buildIdentity() {
   json_object *id = json_object_new_object();
   json_object *kw = json_object_new_object();
   json_object_object_foreach(kwargs, k, v) {
      if (strcmp(k, "timestamp") != 0) {
         json_object_object_add(kw, k, json_object_get(v));
      }
   }
   append_json_string_val(id, "op", op);
   json_object_object_add_ex(id, "args", json_object_get(args), JSON_NEW_CONST_KEY);
   json_object_object_add_ex(id, "kwargs", kw, JSON_NEW_CONST_KEY);
   identity = json_text(id);
   json_object_put(id);
}

json_object *UpdateTask::arg(size_t i) const {
   if (!json_object_is_type(args, json_type_array) || i >= json_object_array_length(args)) {
      return NULL;
   }
   return json_object_array_get_idx(args, i);
}

json_object *UpdateTask::kwarg(const char *key) const {
   json_object *val;
   if (!json_object_object_get_ex(kwargs, key, &val)) {
      return NULL;
   }
   return val;
}

string UpdateTask::describe() const {
   return op + "(" + json_text(args) + ", " + json_text(kwargs) + ")";
}

bool UpdateTask::operator==(const UpdateTask &other) const {
   return identity == other.identity;
}

bool runTaskSafely(TaskRunner *runner, const UpdateTask &task) {
   try {
      runner->runTask(task);
      return true;
   } catch (SyncException &e) {
      log(LERROR, "%s failed: %s\n", task.describe().c_str(), e.getMessage().c_str());
   } catch (std::exception &e) {
      log(LERROR, "%s failed: %s\n", task.describe().c_str(), e.what());
   }
   return false;
}

UpdateTaskState::UpdateTaskState() {
   pthread_mutex_init(&mutex, NULL);
}

UpdateTaskState::~UpdateTaskState() {
   pthread_mutex_destroy(&mutex);
}

list<pair<UpdateTask,bool> >::iterator UpdateTaskState::find(const UpdateTask &task) {
   list<pair<UpdateTask,bool> >::iterator i;
   for (i = tasks.begin(); i != tasks.end(); i++) {
      if (i->first == task) {
         break;
      }
   }
   return i;
}

bool UpdateTaskState::addUpdateTask(const UpdateTask &task) {
   pthread_mutex_lock(&mutex);
   bool added = find(task) == tasks.end();
   if (added) {
      tasks.push_back(make_pair(task, false));
   }
   pthread_mutex_unlock(&mutex);
   return added;
}

bool UpdateTaskState::toggleAutoSyncTask(const UpdateTask &task) {
   pthread_mutex_lock(&mutex);
   list<pair<UpdateTask,bool> >::iterator i = find(task);
   bool enabled;
   if (i != tasks.end() && i->second) {
      tasks.erase(i);
      enabled = false;
   }
   else if (i != tasks.end()) {
      i->second = true;
      enabled = true;
   }
   else {
      tasks.push_back(make_pair(task, true));
      enabled = true;
   }
   pthread_mutex_unlock(&mutex);
   return enabled;
}

bool UpdateTaskState::isAutoSync(const UpdateTask &task) {
   pthread_mutex_lock(&mutex);
   list<pair<UpdateTask,bool> >::iterator i = find(task);
   bool res = i != tasks.end() && i->second;
   pthread_mutex_unlock(&mutex);
   return res;
}

size_t UpdateTaskState::size() {
   pthread_mutex_lock(&mutex);
   size_t res = tasks.size();
   pthread_mutex_unlock(&mutex);
   return res;
}

int UpdateTaskState::doNeededUpdates(TaskRunner *runner) {
   pthread_mutex_lock(&mutex);
   list<pair<UpdateTask,bool> > snapshot = tasks;
   pthread_mutex_unlock(&mutex);

   int count = 0;
   for (list<pair<UpdateTask,bool> >::iterator t = snapshot.begin(); t != snapshot.end(); t++) {
      runTaskSafely(runner, t->first);
      count++;
      if (!t->second) {
         pthread_mutex_lock(&mutex);
         list<pair<UpdateTask,bool> >::iterator i = find(t->first);
         if (i != tasks.end() && !i->second) {
            tasks.erase(i);
         }
         pthread_mutex_unlock(&mutex);
      }
   }
   return count;
}

CommandQueue::CommandQueue() {
   seq = 0;
   pthread_mutex_init(&mutex, NULL);
}

CommandQueue::~CommandQueue() {
   pthread_mutex_destroy(&mutex);
}

void CommandQueue::add(const UpdateTask &task, const string &collapse_key) {
   pthread_mutex_lock(&mutex);
   if (collapse_key.length() > 0) {
      string key = "key:" + collapse_key;
      list<pair<string,UpdateTask> >::iterator i;
      for (i = entries.begin(); i != entries.end(); i++) {
         if (i->first == key) {
            i->second = task;
            break;
         }
      }
      if (i == entries.end()) {
         entries.push_back(make_pair(key, task));
      }
   }
   else {
      char key[32];
      snprintf(key, sizeof(key), "seq:%llu", (unsigned long long)seq++);
      entries.push_back(make_pair(string(key), task));
   }
   pthread_mutex_unlock(&mutex);
}

bool CommandQueue::evalOne(TaskRunner *runner) {
   pthread_mutex_lock(&mutex);
   if (entries.empty()) {
      pthread_mutex_unlock(&mutex);
      return false;
   }
   UpdateTask task = entries.front().second;
   entries.pop_front();
   pthread_mutex_unlock(&mutex);
   runTaskSafely(runner, task);
   return true;
}

bool CommandQueue::peek(const string &collapse_key, UpdateTask &task) {
   string key = "key:" + collapse_key;
   bool found = false;
   pthread_mutex_lock(&mutex);
   for (list<pair<string,UpdateTask> >::iterator i = entries.begin(); i != entries.end(); i++) {
      if (i->first == key) {
         task = i->second;
         found = true;
         break;
      }
   }
   pthread_mutex_unlock(&mutex);
   return found;
}

size_t CommandQueue::size() {
   pthread_mutex_lock(&mutex);
   size_t res = entries.size();
   pthread_mutex_unlock(&mutex);
   return res;
}

vector<UpdateTask> CommandQueue::pending() {
   vector<UpdateTask> res;
   pthread_mutex_lock(&mutex);
   for (list<pair<string,UpdateTask> >::iterator i = entries.begin(); i != entries.end(); i++) {
      res.push_back(i->second);
   }
   pthread_mutex_unlock(&mutex);
   return res;
}
