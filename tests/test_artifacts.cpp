/*
   syncREate test_artifacts.cpp
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
#include <json-c/json.h>
#include <gtest/gtest.h>

#include "utils.h"
#include "artifact.h"
#include "function.h"
#include "comment.h"
#include "stack_variable.h"
#include "structure.h"

TEST(Artifacts, FunctionRoundTrip) {
   Function f(0x4011a0, "parse_header", 1600000000);
   Function g;
   ASSERT_TRUE(g.deserialize(f.serialize()));
   EXPECT_EQ(f, g);
   EXPECT_EQ(1600000000, g.last_change);
   EXPECT_EQ("4011a0", g.key());
}

TEST(Artifacts, CommentRoundTrip) {
   Comment c(0x401000, 0x401010, "checks the magic", true, 42);
   Comment d;
   ASSERT_TRUE(d.deserialize(c.serialize()));
   EXPECT_EQ(c, d);
   EXPECT_TRUE(d.decompiled);
   EXPECT_EQ(42, d.last_change);
}

TEST(Artifacts, StackVariableRoundTrip) {
   StackVariable v(-0x18, OFFSET_IDA, "len", "int", 4, 0x4011a0, 7);
   StackVariable w;
   ASSERT_TRUE(w.deserialize(v.serialize()));
   EXPECT_EQ(v, w);
   EXPECT_EQ(-0x18, w.stack_offset);
   EXPECT_EQ(OFFSET_IDA, w.offset_type);
   EXPECT_EQ("-18", w.key());
}

TEST(Artifacts, StructRoundTrip) {
   Struct s("Header", 16, 9);
   s.addMember("magic", 0, "unsigned int", 4);
   s.addMember("len", 4, "unsigned int", 4);
   s.addMember("data", 8, "char *", 8);
   Struct t;
   ASSERT_TRUE(t.deserialize(s.serialize()));
   EXPECT_EQ(s, t);
   ASSERT_EQ(3u, t.members.size());
   EXPECT_EQ("data", t.members[8].name);
}

TEST(Artifacts, EqualityIgnoresTimestamp) {
   EXPECT_EQ(Function(0x1000, "main", 1), Function(0x1000, "main", 2));
   EXPECT_EQ(Comment(0x1000, 0x1004, "x", false, 1), Comment(0x1000, 0x1004, "x", false, NEVER_CHANGED));
   Struct a("S", 4, 1);
   Struct b("S", 4, 100);
   a.addMember("m", 0, "int", 4);
   b.addMember("m", 0, "int", 4);
   EXPECT_EQ(a, b);
}

TEST(Artifacts, StackVariableEqualityIgnoresConvention) {
   StackVariable a(-0x18, OFFSET_IDA, "len", "int", 4, 0x4011a0, 1);
   StackVariable b(-0x18, OFFSET_BINJA, "len", "int", 4, 0x4011a0, 500);
   EXPECT_EQ(a, b);

   StackVariable c(-0x18, OFFSET_IDA, "size", "int", 4, 0x4011a0, 1);
   EXPECT_NE(a, c);
   StackVariable d(-0x18, OFFSET_IDA, "len", "long", 4, 0x4011a0, 1);
   EXPECT_NE(a, d);
}

TEST(Artifacts, OffsetConversion) {
   StackVariable v(-0x18, OFFSET_IDA, "len", "int", 4, 0x4011a0);
   EXPECT_EQ(-0x18, v.getOffset(OFFSET_IDA));
   EXPECT_EQ(-0x18, v.getOffset(OFFSET_BINJA));
   EXPECT_THROW(v.getOffset(OFFSET_GHIDRA), UnsupportedOffsetConversion);
   EXPECT_THROW(v.getOffset(OFFSET_ANGR), UnsupportedOffsetConversion);

   StackVariable g(0x10, OFFSET_GHIDRA, "buf", "char", 1, 0x4011a0);
   EXPECT_EQ(0x10, g.getOffset(OFFSET_GHIDRA));
   EXPECT_THROW(g.getOffset(OFFSET_IDA), UnsupportedOffsetConversion);
}

TEST(Artifacts, DumpManyIsDeterministic) {
   map<int64_t,StackVariable> vars;
   vars[0x10] = StackVariable(0x10, OFFSET_IDA, "arg", "int", 4, 0x1000);
   vars[-0x8] = StackVariable(-0x8, OFFSET_IDA, "i", "int", 4, 0x1000);
   vars[-0x18] = StackVariable(-0x18, OFFSET_IDA, "len", "int", 4, 0x1000);

   json_object *a = dump_many(vars);
   json_object *b = dump_many(vars);
   string first = dump_json(a);
   EXPECT_EQ(first, dump_json(b));

   //sorted by offset
   size_t p1 = first.find("\"-18\"");
   size_t p2 = first.find("\"-8\"");
   size_t p3 = first.find("\"10\"");
   ASSERT_NE(string::npos, p1);
   ASSERT_NE(string::npos, p2);
   ASSERT_NE(string::npos, p3);
   EXPECT_LT(p1, p2);
   EXPECT_LT(p2, p3);

   vector<StackVariable> back = load_many<StackVariable>(a);
   ASSERT_EQ(3u, back.size());
   EXPECT_EQ(vars[-0x18], back[0]);
   json_object_put(a);
   json_object_put(b);
}

TEST(Artifacts, LoadManySkipsBadItems) {
   json_object *obj = parse_json("{\"1000\": {\"addr\": 4096, \"name\": \"main\", \"last_change\": 3},"
                                 " \"bogus\": 5,"
                                 " \"2000\": {\"name\": \"no_addr\"}}");
   ASSERT_TRUE(obj != NULL);
   vector<Function> funcs = load_many<Function>(obj);
   ASSERT_EQ(1u, funcs.size());
   EXPECT_EQ(0x1000u, funcs[0].addr);
   EXPECT_EQ("main", funcs[0].name);
   json_object_put(obj);
}

TEST(Artifacts, DeserializeRejectsGarbage) {
   Function f;
   EXPECT_FALSE(f.deserialize("not json"));
   EXPECT_FALSE(f.deserialize("[1, 2]"));
   Struct s;
   EXPECT_FALSE(s.deserialize("{\"name\": \"\", \"size\": 4}"));
}

TEST(Artifacts, AddressFormatting) {
   EXPECT_EQ("4011a0", formatAddr(0x4011a0));
   EXPECT_EQ("-18", formatOffset(-0x18));
   uint64_t addr;
   EXPECT_TRUE(parseAddr("4011a0", &addr));
   EXPECT_EQ(0x4011a0u, addr);
   EXPECT_FALSE(parseAddr("xyz", &addr));
   int64_t off;
   EXPECT_TRUE(parseOffset("-18", &off));
   EXPECT_EQ(-0x18, off);
}
