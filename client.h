/*
   syncREate client.h
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

#ifndef __SYNC_CLIENT_H
#define __SYNC_CLIENT_H

#include <stdint.h>
#include <time.h>
#include <pthread.h>
#include <string>
#include <vector>

#include "utils.h"
#include "state.h"
#include "repository.h"

using namespace std;

enum ConnectionWarning {
   HASH_MISMATCH
};

const char *connectionWarningText(ConnectionWarning w);

/**
 * Client
 * Owns the connection to a sync repository on behalf of the local analyst
 * (the master user). Every state operation requires a successful connect.
 */
class Client {
public:
   Client();
   ~Client();

   /**
    * connect opens (or creates) a repository for user
    * @param user the local analyst's identity
    * @param repoPath root of the local repository
    * @param binaryHash md5 of the binary being analyzed, may be empty
    * @param initRepo create the repository rather than open an existing one
    * @param remoteUrl remote to clone from when initRepo is set
    * @return warnings about the repository, the connection is made regardless
    * @throws RepositoryException if the repository can't be opened or created
    * @throws SyncException if user is not a usable identity
    */
   vector<ConnectionWarning> connect(const string &user, const string &repoPath, const string &binaryHash,
                                     bool initRepo = false, const string &remoteUrl = "");
   void disconnect();
   bool isConnected();

   /**
    * getState reads a user's state from the repository
    * @param user whose state to read, empty for the master user
    * @param version the version to read, negative for the newest
    * @param locked take the writer lock for the master user's state, the
    *        caller must release it with unlockState
    * @throws NotConnectedException before connect
    * @throws NotFoundException if user has no such state
    */
   State getState(const string &user = "", int64_t version = -1, bool locked = false);
   void unlockState();

   /**
    * pull fetches from the remote. Errors are logged and never thrown, the
    * attempt is recorded either way.
    * @param now time of the attempt, 0 for the current time
    */
   bool pull(time_t now = 0);

   //publish the master user's newest state to the remote
   bool push();

   /**
    * syncStates merges user's newest state into the master user's state and
    * commits the result. Nothing is applied to the host tool.
    * @return the number of artifacts taken from user
    */
   int syncStates(const string &user);

   vector<string> users();
   bool hasRemote();
   const string &getMasterUser() {return master_user;};
   time_t getLastPullAttempt();
   Repository *getRepository() {return repo;};

private:
   void requireConnection();

   string master_user;
   Repository *repo;
   time_t last_pull_attempt;
   pthread_mutex_t state_mutex;
   pthread_mutex_t pull_mutex;
};

/**
 * StateCtx
 * Scoped writable state of the master user. The state is committed when the
 * scope is left normally. When it is left by an exception nothing is written.
 */
class StateCtx {
public:
   StateCtx(Client *client);
   ~StateCtx();

   State &operator*() {return state;};
   State *operator->() {return &state;};

   /**
    * commit saves the state now rather than at the end of the scope
    * @throws RepositoryException if the commit failed
    */
   bool commit();

   //leave the repository untouched at the end of the scope
   void discard() {done = true;};

private:
   StateCtx(const StateCtx &);
   StateCtx &operator=(const StateCtx &);

   Client *client;
   State state;
   bool done;
};

#endif
