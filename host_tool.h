/*
   syncREate host_tool.h
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

#ifndef __SYNC_HOST_TOOL_H
#define __SYNC_HOST_TOOL_H

#include <stdint.h>
#include <string>
#include <map>

#include "utils.h"
#include "state.h"

using namespace std;

class SyncController;

/**
 * HostTool
 * The disassembler/decompiler the analyst works in. Every mutation that
 * succeeds is reported back through exactly one HostEvent, which is how
 * the hook layer recognizes changes it made itself. Mutations return
 * false on failure, the caller skips that artifact and carries on.
 */
class HostTool {
public:
   virtual ~HostTool() {};

   /**
    * getFunctionAt finds the function containing addr
    * @param addr any address
    * @param start receives the function's start address
    * @return false if addr is not inside a function
    */
   virtual bool getFunctionAt(uint64_t addr, uint64_t *start) = 0;
   virtual bool getFunctionName(uint64_t addr, string &name) = 0;
   virtual bool setFunctionName(uint64_t addr, const string &name) = 0;

   /**
    * getStackFrame lists the members of a function's stack frame
    * @param func_addr start of the function
    * @param frame receives the members keyed by offset in offsetType() convention
    * @return false if the function has no frame
    */
   virtual bool getStackFrame(uint64_t func_addr, StackVarMap &frame) = 0;
   virtual StackOffsetType offsetType() = 0;
   virtual bool renameStackMember(uint64_t func_addr, int64_t offset, const string &name) = 0;
   virtual bool setMemberType(uint64_t func_addr, int64_t offset, const string &type) = 0;

   //true if type can be parsed into one of the host's types
   virtual bool isKnownType(const string &type) = 0;

   virtual bool getComment(uint64_t addr, bool decompiled, string &text) = 0;
   virtual bool setComment(uint64_t addr, const string &text, bool decompiled) = 0;

   virtual bool getStruct(const string &name, Struct &s) = 0;

   //create or replace a struct's layout, member types are applied separately
   virtual bool setStruct(const Struct &s) = 0;
   virtual bool setStructMemberTypes(const Struct &s) = 0;

   //md5 of the binary being analyzed, empty if unknown
   virtual string currentBinaryHash() = 0;
   virtual void refreshView(uint64_t addr) = 0;
};

/**
 * InfoSurface
 * A registered view of sync information that gets periodically reloaded
 * by the background loop
 */
class InfoSurface {
public:
   virtual ~InfoSurface() {};

   /**
    * @throws SurfaceClosedException if the surface is gone
    */
   virtual void reload(SyncController *sc) = 0;
};

enum HostEventKind {
   EV_FUNCTION_RENAMED,
   EV_STACK_MEMBER_RENAMED,
   EV_STACK_MEMBER_TYPE_CHANGED,
   EV_STRUCT_CREATED,
   EV_STRUCT_RENAMED,
   EV_STRUCT_MEMBER_CHANGED,
   EV_STRUCT_DELETED,
   EV_COMMENT_CHANGED,
   EV_DECOMPILED_COMMENT_CHANGED,
   EV_VIEW_REFRESHED
};

/**
 * HostEvent
 * Everything the host reports about one change. Which fields are used
 * depends on kind:
 *   function renamed            addr, name
 *   stack member renamed/typed  func_addr, offset, name, type, size
 *   struct events               structure (empty name when deleted), old_name
 *   comment changed             func_addr, addr, text
 *   decompiled comment changed  func_addr, comments (the function's full set)
 *   view refreshed              func_addr, comments
 */
struct HostEvent {
   HostEvent(HostEventKind kind = EV_VIEW_REFRESHED) : kind(kind), addr(0), func_addr(0), offset(0), size(0) {};

   HostEventKind kind;
   uint64_t addr;
   uint64_t func_addr;
   int64_t offset;
   uint32_t size;
   string name;
   string type;
   string text;
   string old_name;
   Struct structure;
   map<uint64_t,string> comments;
};

#endif
