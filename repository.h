/*
   syncREate repository.h
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

#ifndef __SYNC_REPOSITORY_H
#define __SYNC_REPOSITORY_H

#include <stdint.h>
#include <string>
#include <vector>
#include <map>
#include <pthread.h>

using namespace std;

#define METADATA_FILE "metadata.json"
#define VERSIONS_DIR  ".versions"

/**
 * Repository
 * The version controlled store every user's snapshots live in. A snapshot
 * is a set of files (path relative to the user's directory -> contents).
 */
class Repository {
public:
   virtual ~Repository() {};

   virtual const string &getRoot() = 0;
   virtual bool hasRemote() = 0;

   //every user identity with at least one committed snapshot
   virtual vector<string> users() = 0;

   //newest committed version of user, -1 if user has none
   virtual int64_t latestVersion(const string &user) = 0;

   /**
    * readSnapshot loads a complete snapshot
    * @param user whose snapshot to read
    * @param version the version to read, negative for the newest
    * @param files receives the snapshot's files
    * @param actual receives the version that was read, may be NULL
    * @return false if no such snapshot exists
    */
   virtual bool readSnapshot(const string &user, int64_t version, map<string,string> &files, int64_t *actual) = 0;

   /**
    * commitSnapshot stores files as the user's next version. Either the whole
    * snapshot becomes visible or nothing does.
    * @return the new version number
    * @throws RepositoryException on failure
    */
   virtual int64_t commitSnapshot(const string &user, const map<string,string> &files) = 0;

   /**
    * pull fetches newer snapshots of other users from the remote
    * @param self the local identity, only fetched when no local copy exists
    * @return true if anything new arrived
    * @throws RepositoryException if the remote can't be read
    */
   virtual bool pull(const string &self) = 0;

   /**
    * push publishes user's newest snapshot to the remote
    * @return true if the remote was updated
    * @throws RepositoryException if the remote can't be written
    */
   virtual bool push(const string &user) = 0;

   virtual string getBinaryHash() = 0;
   virtual void setBinaryHash(const string &hash) = 0;
};

/**
 * DirectoryRepository
 * A Repository kept in a plain directory tree:
 *
 *    <root>/metadata.json             binary hash and remote
 *    <root>/.versions/<user>/<n>/     immutable snapshot n of user
 *    <root>/<user>                    symlink to the newest snapshot
 *
 * A commit writes a complete new snapshot directory, then renames a fresh
 * symlink over <root>/<user>, so readers only ever see whole snapshots.
 * The remote is another DirectoryRepository root.
 */
class DirectoryRepository : public Repository {
public:
   /**
    * open an existing repository
    * @throws RepositoryException if root is not a repository
    */
   static DirectoryRepository *open(const string &root);

   /**
    * init creates a new repository, cloning remote when one is given
    * @throws RepositoryException if root already holds a repository or remote is unusable
    */
   static DirectoryRepository *init(const string &root, const string &remote);

   static bool isRepository(const string &root);

   virtual ~DirectoryRepository();

   const string &getRoot() {return root;};
   bool hasRemote() {return remote.length() > 0;};
   const string &getRemote() {return remote;};

   vector<string> users();
   int64_t latestVersion(const string &user);
   bool readSnapshot(const string &user, int64_t version, map<string,string> &files, int64_t *actual);
   int64_t commitSnapshot(const string &user, const map<string,string> &files);
   bool pull(const string &self);
   bool push(const string &user);

   string getBinaryHash();
   void setBinaryHash(const string &hash);

private:
   DirectoryRepository(const string &root);
   bool loadMetadata();
   bool saveMetadata();
   bool install(const string &user, int64_t version, const map<string,string> &files);

   string root;
   string remote;
   string binary_hash;
   pthread_mutex_t mutex;
};

#endif
