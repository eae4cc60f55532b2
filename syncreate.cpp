/*
   syncREate syncreate.cpp
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
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <time.h>
#include <string>
#include <vector>
#include <map>
#include <json-c/json.h>

#include "utils.h"
#include "client.h"
#include "sync_controller.h"
#include "activity.h"

json_object *conf = NULL;

void usage(const char *prog) {
   fprintf(stderr, "usage: %s [-c conf] [-u user] [-r repo] [-R remote] [-i] [-b binary] command [user]\n", prog);
   fprintf(stderr, "commands:\n");
   fprintf(stderr, "   status        show the connection status\n");
   fprintf(stderr, "   users         list every user in the repository\n");
   fprintf(stderr, "   pull          fetch other users' work from the remote\n");
   fprintf(stderr, "   push          publish your work to the remote\n");
   fprintf(stderr, "   sync <user>   merge user's work into yours\n");
   fprintf(stderr, "   activity      most recent change of every function\n");
   fprintf(stderr, "   dump [user]   print a user's state\n");
   exit(1);
}

int dump(Client &client, const string &user) {
   State s = client.getState(user);
   map<string,string> files = s.dumpFiles();
   printf("# %s version %lld\n", s.getUser().c_str(), (long long)s.getVersion());
   for (map<string,string>::iterator i = files.begin(); i != files.end(); i++) {
      printf("== %s\n%s", i->first.c_str(), i->second.c_str());
   }
   return 0;
}

int runCommand(SyncController &sc, const string &cmd, const string &arg) {
   Client *client = sc.getClient();
   if (cmd == "status") {
      printf("%s\n", sc.statusString().c_str());
   }
   else if (cmd == "users") {
      vector<string> users = sc.users();
      for (vector<string>::iterator u = users.begin(); u != users.end(); u++) {
         printf("%s%s\n", u->c_str(), *u == client->getMasterUser() ? " *" : "");
      }
   }
   else if (cmd == "pull") {
      if (!client->hasRemote()) {
         fprintf(stderr, "repository has no remote\n");
         return 1;
      }
      printf("%s\n", client->pull() ? "pulled new changes" : "nothing new");
   }
   else if (cmd == "push") {
      if (!client->hasRemote()) {
         fprintf(stderr, "repository has no remote\n");
         return 1;
      }
      printf("%s\n", client->push() ? "pushed" : "nothing to push");
   }
   else if (cmd == "sync") {
      if (arg.length() == 0) {
         return -1;
      }
      int taken = client->syncStates(arg);
      printf("took %d changes from %s\n", taken, arg.c_str());
      if (taken > 0 && client->hasRemote()) {
         client->push();
      }
   }
   else if (cmd == "activity") {
      ActivityTable table;
      table.reload(&sc);
      printf("%s", table.render(time(NULL)).c_str());
   }
   else if (cmd == "dump") {
      return dump(*client, arg);
   }
   else {
      return -1;
   }
   return 0;
}

int main(int argc, char **argv, char **envp) {
   string user;
   string repo;
   string remote;
   string binary;
   bool init = false;
   int opt;
   while ((opt = getopt(argc, argv, "c:u:r:R:ib:")) != -1) {
      switch (opt) {
         case 'c':
            conf = parseConf(optarg);
            if (conf == NULL) {
               exit(1);
            }
            break;
         case 'u':
            user = optarg;
            break;
         case 'r':
            repo = optarg;
            break;
         case 'R':
            remote = optarg;
            break;
         case 'i':
            init = true;
            break;
         case 'b':
            binary = optarg;
            break;
         default:
            usage(argv[0]);
      }
   }
   if (optind >= argc) {
      usage(argv[0]);
   }
   string cmd = argv[optind];
   string arg = optind + 1 < argc ? argv[optind + 1] : "";

   if (user.length() == 0) {
      user = getStringOption(conf, "SYNC_USER", "");
   }
   if (repo.length() == 0) {
      repo = getStringOption(conf, "SYNC_REPO", "");
   }
   if (remote.length() == 0) {
      remote = getStringOption(conf, "SYNC_REMOTE", "");
   }
   if (user.length() == 0 || repo.length() == 0) {
      fprintf(stderr, "a user (-u) and a repository (-r) are required\n");
      usage(argv[0]);
   }

   string hash;
   if (binary.length() > 0 && !getFileMD5(binary, hash)) {
      exit(1);
   }

   SyncController sc(NULL, conf);
   int res = 0;
   try {
      vector<ConnectionWarning> warnings = sc.getClient()->connect(user, repo, hash, init, remote);
      for (vector<ConnectionWarning>::iterator w = warnings.begin(); w != warnings.end(); w++) {
         fprintf(stderr, "Warning: %s\n", connectionWarningText(*w));
      }
      res = runCommand(sc, cmd, arg);
      if (res == -1) {
         usage(argv[0]);
      }
   } catch (SyncException &e) {
      logln(string(PLUGIN_NAME) + ": " + e.getMessage(), LERROR);
      res = 1;
   }
   if (conf) {
      json_object_put(conf);
   }
   return res;
}
