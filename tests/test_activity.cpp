/*
   syncREate test_activity.cpp
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

#include "utils.h"
#include "client.h"
#include "activity.h"
#include "sync_controller.h"
#include "test_util.h"

TEST(FriendlyDatetime, Past) {
   time_t now = 1000000;
   EXPECT_EQ("0 seconds ago", friendlyDatetime(now, now));
   EXPECT_EQ("59 seconds ago", friendlyDatetime(now - 59, now));
   EXPECT_EQ("1 minutes ago", friendlyDatetime(now - 60, now));
   EXPECT_EQ("5 minutes ago", friendlyDatetime(now - 5 * 60 - 30, now));
   EXPECT_EQ("2 hours ago", friendlyDatetime(now - 2 * 3600 - 59, now));
   EXPECT_EQ("3 days ago", friendlyDatetime(now - 3 * 86400, now));
}

TEST(FriendlyDatetime, Future) {
   time_t now = 1000000;
   EXPECT_EQ("30 seconds in the future", friendlyDatetime(now + 30, now));
   EXPECT_EQ("1 hours in the future", friendlyDatetime(now + 3600, now));
   EXPECT_EQ("2 days in the future", friendlyDatetime(now + 2 * 86400 + 10, now));
}

static void set_functions(Client *c, const vector<Function> &funcs) {
   StateCtx ctx(c);
   for (vector<Function>::const_iterator f = funcs.begin(); f != funcs.end(); f++) {
      ctx->setFunction(*f, false);
   }
}

class Activity : public ::testing::Test {
protected:
   void SetUp() {
      root = tmp.sub("repo");
      alice.connect("alice", root, "", true);
      bob.connect("bob", root, "");
      vector<Function> af;
      af.push_back(Function(0x1000, "alice_init", 100));
      af.push_back(Function(0x2000, "alice_parse", 300));
      set_functions(&alice, af);
      vector<Function> bf;
      bf.push_back(Function(0x1000, "bob_init", 200));
      bf.push_back(Function(0x3000, "untouched"));
      set_functions(&bob, bf);
   }

   TempDir tmp;
   string root;
   Client alice;
   Client bob;
};

TEST_F(Activity, LatestChangeWinsNewestFirst) {
   vector<FunctionActivity> rows = collectFunctionActivity(&alice);
   ASSERT_EQ(2u, rows.size());
   EXPECT_EQ(0x2000u, rows[0].addr);
   EXPECT_EQ("alice", rows[0].user);
   EXPECT_EQ(300, rows[0].last_change);
   EXPECT_EQ(0x1000u, rows[1].addr);
   EXPECT_EQ("bob", rows[1].user);
   EXPECT_EQ(200, rows[1].last_change);
   //names are what the local analyst calls the function
   EXPECT_EQ("alice_init", rows[1].local_name);
}

TEST_F(Activity, HostNamesTakePriority) {
   FakeHost host;
   host.addFunction(0x1000, "start");
   vector<FunctionActivity> rows = collectFunctionActivity(&alice, &host);
   ASSERT_EQ(2u, rows.size());
   EXPECT_EQ("start", rows[1].local_name);
   EXPECT_EQ("alice_parse", rows[0].local_name);
}

TEST_F(Activity, TableReloadsFromController) {
   FakeHost host;
   SyncController sc(&host);
   ActivityTable table;
   table.reload(&sc);
   EXPECT_EQ(0u, table.getRows().size());

   sc.connect("carol", root);
   table.reload(&sc);
   ASSERT_EQ(2u, table.getRows().size());
   string text = table.render(400);
   EXPECT_NE(string::npos, text.find("0x2000"));
   EXPECT_NE(string::npos, text.find("1 minutes ago"));
   EXPECT_NE(string::npos, text.find("bob"));

   table.close();
   EXPECT_THROW(table.reload(&sc), SurfaceClosedException);
}
