/*
   syncREate test_state.cpp
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
#include <string>
#include <vector>
#include <map>
#include <gtest/gtest.h>

#include "utils.h"
#include "state.h"
#include "repository.h"
#include "test_util.h"

TEST(State, FunctionGetSet) {
   State s("alice");
   EXPECT_THROW(s.getFunction(0x1000), NotFoundException);
   time_t before = time(NULL);
   s.setFunction(Function(0x1000, "main"));
   EXPECT_EQ("main", s.getFunction(0x1000).name);
   EXPECT_GE(s.getFunction(0x1000).last_change, (int64_t)before);
   EXPECT_TRUE(s.isDirty());

   s.setFunction(Function(0x2000, "helper", 5), false);
   EXPECT_EQ(5, s.getFunction(0x2000).last_change);
}

TEST(State, StackVariablesMissingIsNotFound) {
   State s("alice");
   EXPECT_THROW(s.getStackVariables(0x1000), NotFoundException);
   s.setStackVariable(StackVariable(-0x18, OFFSET_IDA, "len", "int", 4, 0x1000), -0x18, 0x1000);
   EXPECT_EQ("len", s.getStackVariable(0x1000, -0x18).name);
   EXPECT_THROW(s.getStackVariable(0x1000, -0x20), NotFoundException);
   EXPECT_EQ(1u, s.getStackVariables(0x1000).size());
}

TEST(State, CommentsByFunction) {
   State s("alice");
   s.setComment(Comment(0x1000, 0x1004, "a"));
   s.setComment(Comment(0x1000, 0x1008, "b", true));
   s.setComment(Comment(0x2000, 0x2004, "c"));
   EXPECT_EQ(2u, s.getComments(0x1000).size());
   EXPECT_EQ(1u, s.getComments(0x2000).size());
   EXPECT_EQ(0u, s.getComments(0x3000).size());
   EXPECT_EQ("b", s.getComment(0x1008).comment);

   s.removeComment(0x1004);
   EXPECT_THROW(s.getComment(0x1004), NotFoundException);
   //not there anymore, still fine
   s.removeComment(0x1004);
   EXPECT_EQ(1u, s.getComments(0x1000).size());
}

TEST(State, StructRenameReplacesWholeEntry) {
   State s("alice");
   Struct hdr("Header", 8);
   hdr.addMember("magic", 0, "int", 4);
   s.setStruct(hdr, "");
   ASSERT_EQ(1u, s.getStructs().size());

   Struct renamed("FileHeader", 12);
   renamed.addMember("magic", 0, "int", 4);
   renamed.addMember("len", 4, "int", 4);
   s.setStruct(renamed, "Header");
   vector<Struct> all = s.getStructs();
   ASSERT_EQ(1u, all.size());
   EXPECT_EQ("FileHeader", all[0].name);
   EXPECT_EQ(2u, all[0].members.size());
   EXPECT_THROW(s.getStruct("Header"), NotFoundException);

   //an empty name deletes
   s.setStruct(Struct(), "FileHeader");
   EXPECT_EQ(0u, s.getStructs().size());
}

TEST(State, CompareFunctionIgnoresTimestamps) {
   State a("alice");
   State b("bob");
   a.setFunction(Function(0x4011a0, "parse_header", 100), false);
   b.setFunction(Function(0x4011a0, "parse_header", 900), false);
   a.setStackVariable(StackVariable(-0x18, OFFSET_IDA, "len", "int", 4, 0x4011a0, 1), -0x18, 0x4011a0, false);
   b.setStackVariable(StackVariable(-0x18, OFFSET_IDA, "len", "int", 4, 0x4011a0, 2), -0x18, 0x4011a0, false);
   a.setComment(Comment(0x4011a0, 0x4011b0, "reads the header", false, 5), false);
   b.setComment(Comment(0x4011a0, 0x4011b0, "reads the header", false, 6), false);
   EXPECT_TRUE(a.compareFunction(0x4011a0, b));
   EXPECT_TRUE(b.compareFunction(0x4011a0, a));

   b.setComment(Comment(0x4011a0, 0x4011b0, "reads the footer"));
   EXPECT_FALSE(a.compareFunction(0x4011a0, b));
}

TEST(State, CompareFunctionDetectsEachCategory) {
   State base("alice");
   base.setFunction(Function(0x1000, "main"));
   base.setStackVariable(StackVariable(-8, OFFSET_IDA, "i", "int", 4, 0x1000), -8, 0x1000);

   State name = base;
   name.setFunction(Function(0x1000, "start"));
   EXPECT_FALSE(base.compareFunction(0x1000, name));

   State var = base;
   var.setStackVariable(StackVariable(-8, OFFSET_IDA, "idx", "int", 4, 0x1000), -8, 0x1000);
   EXPECT_FALSE(base.compareFunction(0x1000, var));

   State cmt = base;
   cmt.setComment(Comment(0x1000, 0x1002, "hi"));
   EXPECT_FALSE(base.compareFunction(0x1000, cmt));

   //a function neither state knows about is trivially the same
   EXPECT_TRUE(base.compareFunction(0x5000, name));
   //missing on one side only
   State empty("bob");
   EXPECT_FALSE(base.compareFunction(0x1000, empty));
}

TEST(State, CompareStructs) {
   State a("alice");
   State b("bob");
   Struct s("Header", 8, 1);
   s.addMember("magic", 0, "int", 4);
   a.setStruct(s, "");
   EXPECT_FALSE(a.compareStructs(b));
   b.setStruct(s, "");
   EXPECT_TRUE(a.compareStructs(b));
}

TEST(State, MergeLastWriterWins) {
   State mine("alice");
   State theirs("bob");
   mine.setFunction(Function(0x1000, "mine_old", 100), false);
   theirs.setFunction(Function(0x1000, "theirs_new", 200), false);
   mine.setFunction(Function(0x2000, "mine_new", 300), false);
   theirs.setFunction(Function(0x2000, "theirs_old", 50), false);
   theirs.setFunction(Function(0x3000, "only_theirs", 10), false);
   theirs.setStackVariable(StackVariable(-8, OFFSET_IDA, "i", "int", 4, 0x1000, 10), -8, 0x1000, false);

   EXPECT_EQ(3, mine.merge(theirs));
   EXPECT_EQ("theirs_new", mine.getFunction(0x1000).name);
   EXPECT_EQ("mine_new", mine.getFunction(0x2000).name);
   EXPECT_EQ("only_theirs", mine.getFunction(0x3000).name);
   EXPECT_EQ("i", mine.getStackVariable(0x1000, -8).name);

   //merging again takes nothing
   EXPECT_EQ(0, mine.merge(theirs));
}

TEST(State, DumpAndLoadFiles) {
   State s("alice");
   s.setFunction(Function(0x1000, "main", 1), false);
   s.setStackVariable(StackVariable(-8, OFFSET_IDA, "i", "int", 4, 0x1000, 2), -8, 0x1000, false);
   s.setComment(Comment(0x1000, 0x1004, "loop", false, 3), false);
   Struct hdr("Header", 4, 4);
   hdr.addMember("magic", 0, "int", 4);
   s.setStruct(hdr, "", false);

   map<string,string> files = s.dumpFiles();
   EXPECT_EQ(1u, files.count(FUNCTIONS_FILE));
   EXPECT_EQ(1u, files.count(COMMENTS_FILE));
   EXPECT_EQ(1u, files.count(STRUCTS_FILE));
   EXPECT_EQ(1u, files.count("stack_vars/1000.json"));
   //unchanged data dumps byte identical
   EXPECT_EQ(files, s.dumpFiles());

   State t("alice");
   t.loadFiles(files);
   EXPECT_TRUE(s.compareFunction(0x1000, t));
   EXPECT_TRUE(s.compareStructs(t));
   EXPECT_EQ(2, t.getStackVariable(0x1000, -8).last_change);
   EXPECT_FALSE(t.isDirty());
}

TEST(State, LoadSkipsCorruptFiles) {
   State s("alice");
   s.setFunction(Function(0x1000, "main", 1), false);
   map<string,string> files = s.dumpFiles();
   files[COMMENTS_FILE] = "{ this is not json";

   State t("alice");
   t.loadFiles(files);
   EXPECT_EQ("main", t.getFunction(0x1000).name);
   EXPECT_EQ(0u, t.getAllComments().size());
}

TEST(State, SaveRequiresRepository) {
   State s("alice");
   EXPECT_FALSE(s.save());
   s.setFunction(Function(0x1000, "main"));
   EXPECT_THROW(s.save(), RepositoryException);
}

TEST(State, SaveCommitsSnapshot) {
   TempDir tmp;
   DirectoryRepository *repo = DirectoryRepository::init(tmp.sub("repo"), "");
   State s("alice", -1, repo);
   s.setFunction(Function(0x1000, "main"));
   EXPECT_TRUE(s.save());
   EXPECT_EQ(0, s.getVersion());
   EXPECT_FALSE(s.isDirty());
   EXPECT_FALSE(s.save());
   EXPECT_EQ(0, repo->latestVersion("alice"));
   delete repo;
}
