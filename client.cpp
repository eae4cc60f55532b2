/*
   syncREate client.cpp
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
#include <exception>
#include <string>
#include <vector>
#include <map>

#include "utils.h"
#include "client.h"

const char *connectionWarningText(ConnectionWarning w) {
   switch (w) {
      case HASH_MISMATCH:
         return "The binary being analyzed does not match the binary recorded in the repository";
   }
   return "Unknown warning";
}

static bool validUser(const string &user) {
   if (user.length() == 0 || user[0] == '.' || user == METADATA_FILE) {
      return false;
   }
   return user.find('/') == string::npos;
}

Client::Client() {
   repo = NULL;
   last_pull_attempt = 0;
   pthread_mutex_init(&state_mutex, NULL);
   pthread_mutex_init(&pull_mutex, NULL);
}

Client::~Client() {
   disconnect();
   pthread_mutex_destroy(&state_mutex);
   pthread_mutex_destroy(&pull_mutex);
}

vector<ConnectionWarning> Client::connect(const string &user, const string &repoPath, const string &binaryHash,
                                          bool initRepo, const string &remoteUrl) {
   vector<ConnectionWarning> warnings;
   if (!validUser(user)) {
      throw SyncException("invalid user name: '" + user + "'");
   }
   disconnect();

   if (initRepo) {
      repo = DirectoryRepository::init(repoPath, remoteUrl);
   }
   else {
      repo = DirectoryRepository::open(repoPath);
      if (remoteUrl.length() > 0) {
         log(LINFO, "ignoring remote %s, %s is already a repository\n", remoteUrl.c_str(), repoPath.c_str());
      }
   }
   master_user = user;

   string recorded = repo->getBinaryHash();
   if (binaryHash.length() > 0) {
      if (recorded.length() == 0) {
         try {
            repo->setBinaryHash(binaryHash);
         } catch (RepositoryException &e) {
            log(LWARNING, "%s\n", e.getMessage().c_str());
         }
      }
      else if (recorded != binaryHash) {
         log(LWARNING, "binary hash %s does not match repository hash %s\n", binaryHash.c_str(), recorded.c_str());
         warnings.push_back(HASH_MISMATCH);
      }
   }

   log(LINFO, "%s connected to %s as %s\n", PLUGIN_NAME, repoPath.c_str(), user.c_str());
   if (hasRemote()) {
      pull();
   }
   return warnings;
}

void Client::disconnect() {
   if (repo) {
      delete repo;
      repo = NULL;
      master_user = "";
   }
}

bool Client::isConnected() {
   return repo != NULL;
}

void Client::requireConnection() {
   if (repo == NULL) {
      throw NotConnectedException();
   }
}

State Client::getState(const string &user, int64_t version, bool locked) {
   requireConnection();
   string u = user.length() > 0 ? user : master_user;
   bool lock = locked && u == master_user;
   if (lock) {
      pthread_mutex_lock(&state_mutex);
   }
   map<string,string> files;
   int64_t actual = -1;
   if (!repo->readSnapshot(u, version, files, &actual)) {
      if (u != master_user || version >= 0) {
         if (lock) {
            pthread_mutex_unlock(&state_mutex);
         }
         throw NotFoundException("no state for " + u);
      }
      //a brand new analyst starts out empty
      return State(u, -1, repo);
   }
   State res(u, actual, repo);
   res.loadFiles(files);
   return res;
}

void Client::unlockState() {
   pthread_mutex_unlock(&state_mutex);
}

bool Client::pull(time_t now) {
   pthread_mutex_lock(&pull_mutex);
   last_pull_attempt = now ? now : time(NULL);
   pthread_mutex_unlock(&pull_mutex);
   requireConnection();
   if (!hasRemote()) {
      return false;
   }
   try {
      return repo->pull(master_user);
   } catch (RepositoryException &e) {
      log(LERROR, "pull failed: %s\n", e.getMessage().c_str());
   }
   return false;
}

bool Client::push() {
   requireConnection();
   if (!hasRemote()) {
      return false;
   }
   try {
      return repo->push(master_user);
   } catch (RepositoryException &e) {
      log(LERROR, "push failed: %s\n", e.getMessage().c_str());
   }
   return false;
}

int Client::syncStates(const string &user) {
   requireConnection();
   State theirs = getState(user);
   StateCtx ctx(this);
   int taken = ctx->merge(theirs);
   ctx.commit();
   log(LINFO1, "took %d artifacts from %s\n", taken, theirs.getUser().c_str());
   return taken;
}

vector<string> Client::users() {
   requireConnection();
   return repo->users();
}

bool Client::hasRemote() {
   return repo != NULL && repo->hasRemote();
}

time_t Client::getLastPullAttempt() {
   pthread_mutex_lock(&pull_mutex);
   time_t res = last_pull_attempt;
   pthread_mutex_unlock(&pull_mutex);
   return res;
}

StateCtx::StateCtx(Client *client) : client(client), state(client->getState("", -1, true)), done(false) {
}

StateCtx::~StateCtx() {
   if (!done && !std::uncaught_exception()) {
      try {
         state.save();
      } catch (RepositoryException &e) {
         log(LERROR, "unable to save state for %s: %s\n", state.getUser().c_str(), e.getMessage().c_str());
      }
   }
   client->unlockState();
}

bool StateCtx::commit() {
   done = true;
   return state.save();
}
