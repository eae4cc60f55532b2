/*
   syncREate update_task.h
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

#ifndef __SYNC_UPDATE_TASK_H
#define __SYNC_UPDATE_TASK_H

#include <stdint.h>
#include <pthread.h>
#include <string>
#include <vector>
#include <list>
#include <utility>
#include <json-c/json.h>

#include "utils.h"

using namespace std;

/**
 * UpdateTask
 * A unit of deferred work: an operation name plus its positional (json
 * array) and keyword (json object) arguments. Two tasks are equal when the
 * operation and arguments match, the "timestamp" keyword never counts.
 */
class UpdateTask {
public:
   /**
    * @param op the operation to run
    * @param args json array of positional arguments, ownership is taken, may be NULL
    * @param kwargs json object of keyword arguments, ownership is taken, may be NULL
    */
   UpdateTask(const string &op = "", json_object *args = NULL, json_object *kwargs = NULL);
   UpdateTask(const UpdateTask &other);
   UpdateTask &operator=(const UpdateTask &other);
   ~UpdateTask();

   const string &getOp() const {return op;};
   json_object *getArgs() const {return args;};
   json_object *getKwargs() const {return kwargs;};

   //positional argument i, NULL when missing
   json_object *arg(size_t i) const;
   //keyword argument, NULL when missing
   json_object *kwarg(const char *key) const;

   string describe() const;

   bool operator==(const UpdateTask &other) const;
   bool operator!=(const UpdateTask &other) const {return !(*this == other);};

private:
   void buildIdentity();

   string op;
   json_object *args;
   json_object *kwargs;
   string identity;
};

//anything able to execute tasks
class TaskRunner {
public:
   virtual ~TaskRunner() {};
   virtual void runTask(const UpdateTask &task) = 0;
};

/**
 * runTaskSafely executes a task, logging rather than propagating failures so
 * that one bad task never stops the ones queued behind it
 * @return false if the task failed
 */
bool runTaskSafely(TaskRunner *runner, const UpdateTask &task);

/**
 * UpdateTaskState
 * The tasks waiting to be applied to one function, in insertion order. A
 * task is either one-shot (dropped once run) or auto-sync (run every time).
 */
class UpdateTaskState {
public:
   UpdateTaskState();
   ~UpdateTaskState();

   /**
    * addUpdateTask queues a one-shot task
    * @return false if an equal task was already queued
    */
   bool addUpdateTask(const UpdateTask &task);

   /**
    * toggleAutoSyncTask adds task as a recurring task, or removes it if
    * it is already recurring
    * @return true if the task is now recurring
    */
   bool toggleAutoSyncTask(const UpdateTask &task);

   bool isAutoSync(const UpdateTask &task);
   size_t size();

   /**
    * doNeededUpdates runs every queued task in insertion order. The lock is
    * only held while the queue itself is touched so tasks may queue new work.
    * @return the number of tasks run
    */
   int doNeededUpdates(TaskRunner *runner);

private:
   //returns tasks.end() if not present, call with the lock held
   list<pair<UpdateTask,bool> >::iterator find(const UpdateTask &task);

   list<pair<UpdateTask,bool> > tasks;
   pthread_mutex_t mutex;
};

/**
 * CommandQueue
 * Outbound work produced by host tool events. Entries are kept in insertion
 * order under a key. Entries sharing a key collapse into one, keeping their
 * original position but the newest task. Unkeyed entries never collapse.
 */
class CommandQueue {
public:
   CommandQueue();
   ~CommandQueue();

   /**
    * add queues a task
    * @param task the task to queue
    * @param collapse_key entries with the same non empty key collapse
    */
   void add(const UpdateTask &task, const string &collapse_key = "");

   /**
    * evalOne pops the oldest entry and runs it outside the lock
    * @return false if the queue was empty
    */
   bool evalOne(TaskRunner *runner);

   /**
    * peek finds the entry queued under collapse_key
    * @return false if there is none
    */
   bool peek(const string &collapse_key, UpdateTask &task);

   size_t size();
   vector<UpdateTask> pending();

private:
   list<pair<string,UpdateTask> > entries;
   uint64_t seq;
   pthread_mutex_t mutex;
};

#endif
