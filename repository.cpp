/*
   syncREate repository.cpp
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
#include <errno.h>
#include <limits.h>
#include <unistd.h>
#include <dirent.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <pthread.h>
#include <algorithm>
#include <string>
#include <vector>
#include <map>
#include <json-c/json.h>

#include "utils.h"
#include "artifact.h"
#include "repository.h"

static bool isDir(const string &path) {
   struct stat st;
   return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

static bool makeDirs(const string &path) {
   size_t pos = 0;
   while (pos != string::npos) {
      pos = path.find('/', pos + 1);
      string part = path.substr(0, pos);
      if (part.length() == 0) {
         continue;
      }
      if (mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) {
         log(LERROR, "mkdir %s failed: %s\n", part.c_str(), strerror(errno));
         return false;
      }
   }
   return isDir(path);
}

static bool listDir(const string &path, vector<string> &names) {
   DIR *d = opendir(path.c_str());
   if (d == NULL) {
      return false;
   }
   struct dirent *de;
   while ((de = readdir(d)) != NULL) {
      if (strcmp(de->d_name, ".") == 0 || strcmp(de->d_name, "..") == 0) {
         continue;
      }
      names.push_back(de->d_name);
   }
   closedir(d);
   sort(names.begin(), names.end());
   return true;
}

static bool readTree(const string &dir, const string &prefix, map<string,string> &files) {
   vector<string> names;
   if (!listDir(dir, names)) {
      return false;
   }
   for (vector<string>::iterator i = names.begin(); i != names.end(); i++) {
      string full = dir + "/" + *i;
      if (isDir(full)) {
         if (!readTree(full, prefix + *i + "/", files)) {
            return false;
         }
      }
      else if (!readFile(full, files[prefix + *i])) {
         log(LERROR, "unable to read %s: %s\n", full.c_str(), strerror(errno));
         return false;
      }
   }
   return true;
}

static bool writeTree(const string &dir, const map<string,string> &files) {
   for (map<string,string>::const_iterator i = files.begin(); i != files.end(); i++) {
      string full = dir + "/" + i->first;
      size_t slash = full.rfind('/');
      if (!makeDirs(full.substr(0, slash)) || !writeFile(full, i->second)) {
         return false;
      }
   }
   return true;
}

static void removeTree(const string &path) {
   struct stat st;
   if (lstat(path.c_str(), &st) != 0) {
      return;
   }
   if (S_ISDIR(st.st_mode)) {
      vector<string> names;
      listDir(path, names);
      for (vector<string>::iterator i = names.begin(); i != names.end(); i++) {
         removeTree(path + "/" + *i);
      }
      rmdir(path.c_str());
   }
   else {
      unlink(path.c_str());
   }
}

static string versionDir(const string &root, const string &user, int64_t version) {
   char buf[32];
   snprintf(buf, sizeof(buf), "%lld", (long long)version);
   return root + "/" VERSIONS_DIR "/" + user + "/" + buf;
}

//the version a user's symlink currently points at, -1 if there is none
static int64_t linkVersion(const string &root, const string &user) {
   char buf[PATH_MAX];
   ssize_t len = readlink((root + "/" + user).c_str(), buf, sizeof(buf) - 1);
   if (len <= 0) {
      return -1;
   }
   buf[len] = 0;
   const char *slash = strrchr(buf, '/');
   char *end;
   long long v = strtoll(slash ? slash + 1 : buf, &end, 10);
   if (*end != 0) {
      return -1;
   }
   return v;
}

//atomically repoint <root>/<user> at snapshot version
static bool swapLink(const string &root, const string &user, int64_t version) {
   char target[PATH_MAX];
   snprintf(target, sizeof(target), VERSIONS_DIR "/%s/%lld", user.c_str(), (long long)version);
   char tmp[PATH_MAX];
   snprintf(tmp, sizeof(tmp), "%s/.%s.lnk.%d", root.c_str(), user.c_str(), (int)getpid());
   unlink(tmp);
   if (symlink(target, tmp) != 0) {
      log(LERROR, "symlink %s failed: %s\n", tmp, strerror(errno));
      return false;
   }
   if (rename(tmp, (root + "/" + user).c_str()) != 0) {
      log(LERROR, "rename %s failed: %s\n", tmp, strerror(errno));
      unlink(tmp);
      return false;
   }
   return true;
}

DirectoryRepository::DirectoryRepository(const string &root) {
   this->root = root;
   while (this->root.length() > 1 && this->root[this->root.length() - 1] == '/') {
      this->root.erase(this->root.length() - 1);
   }
   pthread_mutex_init(&mutex, NULL);
}

DirectoryRepository::~DirectoryRepository() {
   pthread_mutex_destroy(&mutex);
}

bool DirectoryRepository::isRepository(const string &root) {
   return isDir(root + "/" VERSIONS_DIR);
}

DirectoryRepository *DirectoryRepository::open(const string &root) {
   if (!isRepository(root)) {
      throw RepositoryException(root + " is not a sync repository");
   }
   DirectoryRepository *repo = new DirectoryRepository(root);
   if (!repo->loadMetadata()) {
      log(LWARNING, "%s has no readable " METADATA_FILE "\n", root.c_str());
   }
   return repo;
}

DirectoryRepository *DirectoryRepository::init(const string &root, const string &remote) {
   if (isRepository(root)) {
      throw RepositoryException(root + " already holds a sync repository");
   }
   if (remote.length() > 0 && !isRepository(remote)) {
      throw RepositoryException("remote " + remote + " is not a sync repository");
   }
   if (!makeDirs(root + "/" VERSIONS_DIR)) {
      throw RepositoryException("unable to create repository at " + root);
   }
   DirectoryRepository *repo = new DirectoryRepository(root);
   repo->remote = remote;
   if (!repo->saveMetadata()) {
      delete repo;
      throw RepositoryException("unable to write " METADATA_FILE " in " + root);
   }
   if (remote.length() > 0) {
      try {
         //clone: everything the remote has, our own identity included
         repo->pull("");
      } catch (RepositoryException &e) {
         delete repo;
         throw;
      }
   }
   log(LINFO, "initialized sync repository %s\n", root.c_str());
   return repo;
}

bool DirectoryRepository::loadMetadata() {
   string contents;
   if (!readFile(root + "/" METADATA_FILE, contents)) {
      return false;
   }
   json_object *obj = parse_json(contents);
   if (obj == NULL) {
      return false;
   }
   if (!string_from_json(obj, "binary_hash", binary_hash)) {
      binary_hash = "";
   }
   if (!string_from_json(obj, "remote", remote)) {
      remote = "";
   }
   json_object_put(obj);
   return true;
}

bool DirectoryRepository::saveMetadata() {
   json_object *obj = json_object_new_object();
   append_json_string_val(obj, "binary_hash", binary_hash);
   if (remote.length() > 0) {
      append_json_string_val(obj, "remote", remote);
   }
   string contents = dump_json(obj);
   json_object_put(obj);
   string tmp = root + "/." METADATA_FILE ".tmp";
   if (!writeFile(tmp, contents)) {
      return false;
   }
   if (rename(tmp.c_str(), (root + "/" METADATA_FILE).c_str()) != 0) {
      log(LERROR, "unable to replace " METADATA_FILE ": %s\n", strerror(errno));
      unlink(tmp.c_str());
      return false;
   }
   return true;
}

vector<string> DirectoryRepository::users() {
   vector<string> names;
   vector<string> res;
   listDir(root, names);
   for (vector<string>::iterator i = names.begin(); i != names.end(); i++) {
      struct stat st;
      if ((*i)[0] == '.' || lstat((root + "/" + *i).c_str(), &st) != 0 || !S_ISLNK(st.st_mode)) {
         continue;
      }
      res.push_back(*i);
   }
   return res;
}

int64_t DirectoryRepository::latestVersion(const string &user) {
   return linkVersion(root, user);
}

bool DirectoryRepository::readSnapshot(const string &user, int64_t version, map<string,string> &files, int64_t *actual) {
   if (version < 0) {
      //resolve the link once so a concurrent commit can't mix two snapshots
      version = linkVersion(root, user);
      if (version < 0) {
         return false;
      }
   }
   string dir = versionDir(root, user, version);
   if (!isDir(dir)) {
      return false;
   }
   files.clear();
   if (!readTree(dir, "", files)) {
      return false;
   }
   if (actual) {
      *actual = version;
   }
   return true;
}

//call this only if you already hold the lock
bool DirectoryRepository::install(const string &user, int64_t version, const map<string,string> &files) {
   string dir = versionDir(root, user, version);
   if (!isDir(dir)) {
      string tmp = dir + ".tmp";
      removeTree(tmp);
      if (!makeDirs(tmp) || !writeTree(tmp, files)) {
         removeTree(tmp);
         return false;
      }
      if (rename(tmp.c_str(), dir.c_str()) != 0) {
         log(LERROR, "unable to install %s: %s\n", dir.c_str(), strerror(errno));
         removeTree(tmp);
         return false;
      }
   }
   return swapLink(root, user, version);
}

int64_t DirectoryRepository::commitSnapshot(const string &user, const map<string,string> &files) {
   pthread_mutex_lock(&mutex);
   int64_t version = linkVersion(root, user) + 1;
   while (isDir(versionDir(root, user, version))) {
      version++;
   }
   bool ok = install(user, version, files);
   pthread_mutex_unlock(&mutex);
   if (!ok) {
      throw RepositoryException("commit of " + user + " failed in " + root);
   }
   return version;
}

bool DirectoryRepository::pull(const string &self) {
   if (!hasRemote()) {
      return false;
   }
   if (!isRepository(remote)) {
      throw RepositoryException("remote " + remote + " is not reachable");
   }
   DirectoryRepository rem(remote);
   rem.loadMetadata();
   bool changed = false;
   vector<string> ru = rem.users();
   for (vector<string>::iterator u = ru.begin(); u != ru.end(); u++) {
      int64_t lv = latestVersion(*u);
      if (*u == self && lv >= 0) {
         //our own history is authoritative locally
         continue;
      }
      int64_t rv = rem.latestVersion(*u);
      if (rv <= lv) {
         continue;
      }
      map<string,string> files;
      int64_t actual;
      if (!rem.readSnapshot(*u, rv, files, &actual)) {
         throw RepositoryException("unable to read " + *u + " from remote " + remote);
      }
      pthread_mutex_lock(&mutex);
      bool ok = install(*u, actual, files);
      pthread_mutex_unlock(&mutex);
      if (!ok) {
         throw RepositoryException("unable to store " + *u + " pulled from " + remote);
      }
      log(LINFO1, "pulled %s version %lld\n", u->c_str(), (long long)actual);
      changed = true;
   }
   if (binary_hash.length() == 0 && rem.binary_hash.length() > 0) {
      pthread_mutex_lock(&mutex);
      binary_hash = rem.binary_hash;
      saveMetadata();
      pthread_mutex_unlock(&mutex);
   }
   return changed;
}

bool DirectoryRepository::push(const string &user) {
   if (!hasRemote()) {
      return false;
   }
   if (!isRepository(remote)) {
      throw RepositoryException("remote " + remote + " is not reachable");
   }
   int64_t lv = latestVersion(user);
   if (lv < 0) {
      return false;
   }
   DirectoryRepository rem(remote);
   rem.loadMetadata();
   if (rem.latestVersion(user) >= lv) {
      return false;
   }
   map<string,string> files;
   if (!readSnapshot(user, lv, files, NULL)) {
      throw RepositoryException("unable to read local snapshot of " + user);
   }
   pthread_mutex_lock(&rem.mutex);
   bool ok = rem.install(user, lv, files);
   if (ok && rem.binary_hash.length() == 0 && binary_hash.length() > 0) {
      rem.binary_hash = binary_hash;
      rem.saveMetadata();
   }
   pthread_mutex_unlock(&rem.mutex);
   if (!ok) {
      throw RepositoryException("unable to publish " + user + " to " + remote);
   }
   log(LINFO1, "pushed %s version %lld\n", user.c_str(), (long long)lv);
   return true;
}

string DirectoryRepository::getBinaryHash() {
   pthread_mutex_lock(&mutex);
   string res = binary_hash;
   pthread_mutex_unlock(&mutex);
   return res;
}

void DirectoryRepository::setBinaryHash(const string &hash) {
   pthread_mutex_lock(&mutex);
   binary_hash = hash;
   bool ok = saveMetadata();
   pthread_mutex_unlock(&mutex);
   if (!ok) {
      throw RepositoryException("unable to record binary hash in " + root);
   }
}
