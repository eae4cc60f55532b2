/*
   syncREate test_repository.cpp
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

#include <string>
#include <vector>
#include <map>
#include <gtest/gtest.h>

#include "utils.h"
#include "repository.h"
#include "test_util.h"

static map<string,string> snapshot(const string &marker) {
   map<string,string> files;
   files["functions.json"] = "{ \"marker\": \"" + marker + "\" }\n";
   files["stack_vars/1000.json"] = "{ }\n";
   return files;
}

TEST(Repository, InitAndOpen) {
   TempDir tmp;
   string root = tmp.sub("repo");
   EXPECT_FALSE(DirectoryRepository::isRepository(root));
   EXPECT_THROW(DirectoryRepository::open(root), RepositoryException);

   DirectoryRepository *repo = DirectoryRepository::init(root, "");
   EXPECT_TRUE(DirectoryRepository::isRepository(root));
   EXPECT_FALSE(repo->hasRemote());
   EXPECT_EQ(0u, repo->users().size());
   delete repo;

   EXPECT_THROW(DirectoryRepository::init(root, ""), RepositoryException);
   repo = DirectoryRepository::open(root);
   EXPECT_EQ(-1, repo->latestVersion("alice"));
   delete repo;
}

TEST(Repository, InitRejectsBadRemote) {
   TempDir tmp;
   EXPECT_THROW(DirectoryRepository::init(tmp.sub("repo"), tmp.sub("nowhere")), RepositoryException);
}

TEST(Repository, CommitCreatesVersions) {
   TempDir tmp;
   DirectoryRepository *repo = DirectoryRepository::init(tmp.sub("repo"), "");
   EXPECT_EQ(0, repo->commitSnapshot("alice", snapshot("one")));
   EXPECT_EQ(1, repo->commitSnapshot("alice", snapshot("two")));
   EXPECT_EQ(1, repo->latestVersion("alice"));

   map<string,string> files;
   int64_t actual = -1;
   ASSERT_TRUE(repo->readSnapshot("alice", -1, files, &actual));
   EXPECT_EQ(1, actual);
   EXPECT_EQ(snapshot("two"), files);

   //older snapshots never change
   ASSERT_TRUE(repo->readSnapshot("alice", 0, files, &actual));
   EXPECT_EQ(0, actual);
   EXPECT_EQ(snapshot("one"), files);

   EXPECT_FALSE(repo->readSnapshot("alice", 7, files, NULL));
   EXPECT_FALSE(repo->readSnapshot("bob", -1, files, NULL));

   vector<string> users = repo->users();
   ASSERT_EQ(1u, users.size());
   EXPECT_EQ("alice", users[0]);
   delete repo;
}

TEST(Repository, UserLinkPointsAtNewestSnapshot) {
   TempDir tmp;
   string root = tmp.sub("repo");
   DirectoryRepository *repo = DirectoryRepository::init(root, "");
   repo->commitSnapshot("alice", snapshot("one"));
   repo->commitSnapshot("alice", snapshot("two"));
   string contents;
   ASSERT_TRUE(readFile(root + "/alice/functions.json", contents));
   EXPECT_EQ(snapshot("two")["functions.json"], contents);
   delete repo;
}

TEST(Repository, BinaryHashPersists) {
   TempDir tmp;
   string root = tmp.sub("repo");
   DirectoryRepository *repo = DirectoryRepository::init(root, "");
   EXPECT_EQ("", repo->getBinaryHash());
   repo->setBinaryHash("d41d8cd98f00b204e9800998ecf8427e");
   delete repo;
   repo = DirectoryRepository::open(root);
   EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", repo->getBinaryHash());
   delete repo;
}

TEST(Repository, PushAndPullBetweenRoots) {
   TempDir tmp;
   string remote = tmp.sub("remote");
   delete DirectoryRepository::init(remote, "");
   DirectoryRepository *a = DirectoryRepository::init(tmp.sub("a"), remote);
   DirectoryRepository *b = DirectoryRepository::init(tmp.sub("b"), remote);
   EXPECT_TRUE(a->hasRemote());

   a->setBinaryHash("abc");
   a->commitSnapshot("alice", snapshot("one"));
   EXPECT_TRUE(a->push("alice"));
   EXPECT_FALSE(a->push("alice"));

   EXPECT_TRUE(b->pull("bob"));
   EXPECT_FALSE(b->pull("bob"));
   EXPECT_EQ(0, b->latestVersion("alice"));
   map<string,string> files;
   ASSERT_TRUE(b->readSnapshot("alice", -1, files, NULL));
   EXPECT_EQ(snapshot("one"), files);
   EXPECT_EQ("abc", b->getBinaryHash());

   a->commitSnapshot("alice", snapshot("two"));
   a->commitSnapshot("alice", snapshot("three"));
   EXPECT_TRUE(a->push("alice"));
   EXPECT_TRUE(b->pull("bob"));
   EXPECT_EQ(2, b->latestVersion("alice"));
   delete a;
   delete b;
}

TEST(Repository, PullSkipsOwnHistory) {
   TempDir tmp;
   string remote = tmp.sub("remote");
   delete DirectoryRepository::init(remote, "");
   DirectoryRepository *a = DirectoryRepository::init(tmp.sub("a"), remote);
   a->commitSnapshot("alice", snapshot("one"));
   a->commitSnapshot("alice", snapshot("two"));
   EXPECT_TRUE(a->push("alice"));

   //a fresh clone gets its own identity too
   DirectoryRepository *clone = DirectoryRepository::init(tmp.sub("clone"), remote);
   EXPECT_EQ(1, clone->latestVersion("alice"));

   //once there is a local copy it is never replaced by a pull
   a->commitSnapshot("alice", snapshot("three"));
   EXPECT_TRUE(a->push("alice"));
   EXPECT_FALSE(clone->pull("alice"));
   EXPECT_EQ(1, clone->latestVersion("alice"));

   //but anyone else pulling gets it
   DirectoryRepository *b = DirectoryRepository::init(tmp.sub("b"), remote);
   EXPECT_EQ(2, b->latestVersion("alice"));
   delete b;
   delete clone;
   delete a;
}

TEST(Repository, PullFromVanishedRemoteThrows) {
   TempDir tmp;
   string remote = tmp.sub("remote");
   delete DirectoryRepository::init(remote, "");
   DirectoryRepository *a = DirectoryRepository::init(tmp.sub("a"), remote);
   a->commitSnapshot("alice", snapshot("one"));
   removeAll(remote);
   EXPECT_THROW(a->pull("alice"), RepositoryException);
   EXPECT_THROW(a->push("alice"), RepositoryException);
   delete a;
}
