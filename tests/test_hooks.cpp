/*
   syncREate test_hooks.cpp
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
#include <gtest/gtest.h>
#include <json-c/json.h>

#include "utils.h"
#include "sync_controller.h"
#include "hooks.h"
#include "test_util.h"

static void drain(SyncController &sc) {
   while (sc.getCommandQueue()->evalOne(&sc)) {
   }
}

static bool api_set(const UpdateTask &t) {
   json_object *k = t.kwarg("api_set");
   return k != NULL && json_object_get_boolean(k);
}

class Hooked : public ::testing::Test {
protected:
   Hooked() : sc(&host), hooks(&sc) {}

   void SetUp() {
      sc.connect("alice", tmp.sub("repo"), true);
      host.addFunction(0x1000, "sub_1000");
      host.addFunction(0x2000, "sub_2000");
      host.addFunction(0x3000, "sub_3000");
      host.addFunction(0x4000, "sub_4000");
      host.addFrameMember(0x1000, 0x8, "var_8", "int", 4);
      host.hooks = &hooks;
   }

   vector<UpdateTask> pending() {
      return sc.getCommandQueue()->pending();
   }

   TempDir tmp;
   FakeHost host;
   SyncController sc;
   HookDispatcher hooks;
};

TEST_F(Hooked, ApiCounterMarksOwnEvents) {
   sc.incApiCount();
   sc.incApiCount();
   sc.incApiCount();
   host.setFunctionName(0x1000, "one");
   host.setFunctionName(0x2000, "two");
   host.setFunctionName(0x3000, "three");
   host.setFunctionName(0x4000, "mine");
   EXPECT_EQ(0, sc.getApiCount());

   vector<UpdateTask> p = pending();
   ASSERT_EQ(4u, p.size());
   EXPECT_TRUE(api_set(p[0]));
   EXPECT_TRUE(api_set(p[1]));
   EXPECT_TRUE(api_set(p[2]));
   EXPECT_FALSE(api_set(p[3]));
   EXPECT_TRUE(p[3].kwarg("timestamp") != NULL);
   EXPECT_EQ(OP_PUSH_FUNCTION_NAME, p[3].getOp());

   drain(sc);
   State s = sc.getClient()->getState();
   EXPECT_EQ("three", s.getFunction(0x3000).name);
   EXPECT_EQ(NEVER_CHANGED, s.getFunction(0x1000).last_change);
   EXPECT_EQ(NEVER_CHANGED, s.getFunction(0x3000).last_change);
   EXPECT_NE(NEVER_CHANGED, s.getFunction(0x4000).last_change);
}

TEST_F(Hooked, CounterNeverGoesNegative) {
   sc.decApiCount();
   EXPECT_EQ(0, sc.getApiCount());
   EXPECT_FALSE(sc.consumeApiCount());
   host.setFunctionName(0x1000, "main");
   ASSERT_EQ(1u, pending().size());
   EXPECT_FALSE(api_set(pending()[0]));
}

TEST_F(Hooked, UninterestingEventsAreDropped) {
   HostEvent unnamed(EV_FUNCTION_RENAMED);
   unnamed.addr = 0x1000;
   hooks.notify(unnamed);

   HostEvent blank(EV_COMMENT_CHANGED);
   blank.func_addr = 0x1000;
   blank.addr = 0x1004;
   hooks.notify(blank);

   HostEvent frame(EV_STRUCT_CREATED);
   frame.structure = Struct("$ F1000", 16);
   hooks.notify(frame);

   HostEvent no_comments(EV_DECOMPILED_COMMENT_CHANGED);
   no_comments.func_addr = 0x1000;
   hooks.notify(no_comments);

   EXPECT_EQ(0u, sc.getCommandQueue()->size());
}

TEST(Hooks, NothingQueuedWhileDisconnected) {
   FakeHost host;
   SyncController sc(&host);
   HookDispatcher hooks(&sc);
   host.hooks = &hooks;
   host.addFunction(0x1000, "sub_1000");
   host.setFunctionName(0x1000, "main");
   EXPECT_EQ(0u, sc.getCommandQueue()->size());
}

TEST_F(Hooked, UntypedStackMembersGetADefaultType) {
   HostEvent ev(EV_STACK_MEMBER_RENAMED);
   ev.func_addr = 0x1000;
   ev.offset = 0x8;
   ev.name = "count";
   ev.size = 4;
   hooks.notify(ev);
   ASSERT_EQ(1u, pending().size());
   EXPECT_EQ(OP_PUSH_STACK_VARIABLE, pending()[0].getOp());
   EXPECT_STREQ("unsigned int", json_object_get_string(pending()[0].arg(3)));

   drain(sc);
   const StackVariable &v = sc.getClient()->getState().getStackVariable(0x1000, 0x8);
   EXPECT_EQ("count", v.name);
   EXPECT_EQ("unsigned int", v.type);
   EXPECT_EQ(4u, v.size);
}

TEST_F(Hooked, StructPushesCollapse) {
   Struct hdr("Header", 8);
   hdr.addMember("magic", 0, "unsigned int", 4);
   host.setStruct(hdr);
   host.setStructMemberTypes(hdr);
   EXPECT_EQ(1u, pending().size());

   drain(sc);
   State s = sc.getClient()->getState();
   EXPECT_TRUE(s.getStruct("Header") == hdr);
}

TEST_F(Hooked, CollapsedPushKeepsPendingRename) {
   HostEvent created(EV_STRUCT_CREATED);
   created.structure = Struct("Header", 8);
   created.structure.addMember("magic", 0, "unsigned int", 4);
   hooks.notify(created);

   HostEvent renamed(EV_STRUCT_RENAMED);
   renamed.structure = created.structure;
   renamed.structure.name = "Hdr";
   renamed.old_name = "Header";
   hooks.notify(renamed);

   HostEvent grown(EV_STRUCT_MEMBER_CHANGED);
   grown.structure = renamed.structure;
   grown.structure.addMember("len", 4, "unsigned int", 4);
   hooks.notify(grown);

   EXPECT_EQ(2u, pending().size());
   UpdateTask t;
   ASSERT_TRUE(sc.getCommandQueue()->peek("Hdr", t));
   EXPECT_STREQ("Header", json_object_get_string(t.arg(1)));

   drain(sc);
   State s = sc.getClient()->getState();
   EXPECT_THROW(s.getStruct("Header"), NotFoundException);
   EXPECT_EQ(2u, s.getStruct("Hdr").members.size());

   HostEvent deleted(EV_STRUCT_DELETED);
   deleted.old_name = "Hdr";
   hooks.notify(deleted);
   ASSERT_EQ(1u, pending().size());
   EXPECT_TRUE(pending()[0].arg(0) == NULL);
   drain(sc);
   EXPECT_EQ(0u, sc.getClient()->getState().getStructs().size());
}

TEST_F(Hooked, DecompiledCommentsArePushedOnce) {
   host.setComment(0x1010, "loop start", true);
   ASSERT_EQ(1u, pending().size());
   EXPECT_EQ(OP_PUSH_COMMENTS, pending()[0].getOp());

   //a refresh showing the same comments pushes nothing new
   HostEvent refresh(EV_VIEW_REFRESHED);
   refresh.func_addr = 0x1000;
   refresh.comments = host.decompiledComments(0x1000);
   hooks.notify(refresh);
   EXPECT_EQ(1u, pending().size());

   refresh.comments[0x1020] = "loop end";
   hooks.notify(refresh);
   EXPECT_EQ(2u, pending().size());

   drain(sc);
   State s = sc.getClient()->getState();
   EXPECT_TRUE(s.getComment(0x1010).decompiled);
   EXPECT_EQ("loop end", s.getComment(0x1020).comment);
   EXPECT_EQ(2u, s.getComments(0x1000).size());
}

TEST_F(Hooked, PlainCommentsArePushed) {
   host.setComment(0x1004, "check size", false);
   drain(sc);
   const Comment &c = sc.getClient()->getState().getComment(0x1004);
   EXPECT_EQ(0x1000u, c.func_addr);
   EXPECT_FALSE(c.decompiled);
   EXPECT_EQ("check size", c.comment);
}

//refreshes its view through the hooks, like a real decompiler does
class RefreshingHost : public FakeHost {
public:
   void refreshView(uint64_t addr) {
      refreshes++;
      HostEvent ev(EV_VIEW_REFRESHED);
      ev.func_addr = addr;
      ev.comments = decompiledComments(addr);
      hooks->notify(ev);
   }
};

TEST(Hooks, ViewRefreshRunsPendingUpdatesOnce) {
   TempDir tmp;
   RefreshingHost host;
   SyncController sc(&host);
   HookDispatcher hooks(&sc);
   sc.connect("alice", tmp.sub("repo"), true);
   host.addFunction(0x1000, "sub_1000");
   host.hooks = &hooks;

   sc.pushFunctionName(0x1000, "main");
   EXPECT_TRUE(sc.toggleAutoSync(0x1000, "alice"));

   HostEvent ev(EV_VIEW_REFRESHED);
   ev.func_addr = 0x1000;
   hooks.notify(ev);
   EXPECT_EQ("main", host.functions[0x1000]);
   EXPECT_EQ(1, host.refreshes);
   EXPECT_EQ(1u, sc.updateState(0x1000)->size());
}
