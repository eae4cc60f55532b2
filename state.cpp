/*
   syncREate state.cpp
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
#include <string>
#include <vector>
#include <map>
#include <json-c/json.h>

#include "utils.h"
#include "state.h"
#include "repository.h"

static const StackVarMap empty_vars;

State::State(const string &user, int64_t version, Repository *repo) {
   this->user = user;
   this->version = version;
   this->repo = repo;
   dirty = false;
}

const Function &State::getFunction(uint64_t addr) const {
   map<uint64_t,Function>::const_iterator i = functions.find(addr);
   if (i == functions.end()) {
      throw NotFoundException("no function at 0x" + formatAddr(addr));
   }
   return i->second;
}

void State::setFunction(const Function &f, bool set_last_change) {
   Function nf = f;
   if (set_last_change) {
      nf.last_change = time(NULL);
   }
   functions[nf.addr] = nf;
   dirty = true;
}

const StackVariable &State::getStackVariable(uint64_t func_addr, int64_t offset) const {
   const StackVarMap &vars = getStackVariables(func_addr);
   StackVarMap::const_iterator i = vars.find(offset);
   if (i == vars.end()) {
      throw NotFoundException("no stack variable at offset " + formatOffset(offset) + " in 0x" + formatAddr(func_addr));
   }
   return i->second;
}

const StackVarMap &State::getStackVariables(uint64_t func_addr) const {
   map<uint64_t,StackVarMap>::const_iterator i = stack_vars.find(func_addr);
   if (i == stack_vars.end()) {
      throw NotFoundException("no stack variables for 0x" + formatAddr(func_addr));
   }
   return i->second;
}

void State::setStackVariable(const StackVariable &v, int64_t offset, uint64_t func_addr, bool set_last_change) {
   StackVariable nv = v;
   if (set_last_change) {
      nv.last_change = time(NULL);
   }
   stack_vars[func_addr][offset] = nv;
   dirty = true;
}

const Comment &State::getComment(uint64_t addr) const {
   map<uint64_t,Comment>::const_iterator i = comments.find(addr);
   if (i == comments.end()) {
      throw NotFoundException("no comment at 0x" + formatAddr(addr));
   }
   return i->second;
}

map<uint64_t,Comment> State::getComments(uint64_t func_addr) const {
   map<uint64_t,Comment> res;
   for (map<uint64_t,Comment>::const_iterator i = comments.begin(); i != comments.end(); i++) {
      if (i->second.func_addr == func_addr) {
         res[i->first] = i->second;
      }
   }
   return res;
}

void State::setComment(const Comment &c, bool set_last_change) {
   Comment nc = c;
   if (set_last_change) {
      nc.last_change = time(NULL);
   }
   comments[nc.addr] = nc;
   dirty = true;
}

void State::removeComment(uint64_t addr) {
   if (comments.erase(addr) > 0) {
      dirty = true;
   }
}

const Struct &State::getStruct(const string &name) const {
   map<string,Struct>::const_iterator i = structs.find(name);
   if (i == structs.end()) {
      throw NotFoundException("no struct named " + name);
   }
   return i->second;
}

vector<Struct> State::getStructs() const {
   vector<Struct> res;
   for (map<string,Struct>::const_iterator i = structs.begin(); i != structs.end(); i++) {
      res.push_back(i->second);
   }
   return res;
}

void State::setStruct(const Struct &s, const string &old_name, bool set_last_change) {
   if (old_name.length() > 0 && old_name != s.name) {
      structs.erase(old_name);
   }
   if (!s.isDeleted()) {
      Struct ns = s;
      if (set_last_change) {
         ns.last_change = time(NULL);
      }
      structs[ns.name] = ns;
   }
   dirty = true;
}

bool State::compareFunction(uint64_t addr, const State &other) const {
   map<uint64_t,Function>::const_iterator mine = functions.find(addr);
   map<uint64_t,Function>::const_iterator theirs = other.functions.find(addr);
   if ((mine == functions.end()) != (theirs == other.functions.end())) {
      return false;
   }
   if (mine != functions.end() && mine->second != theirs->second) {
      return false;
   }

   map<uint64_t,StackVarMap>::const_iterator mv = stack_vars.find(addr);
   map<uint64_t,StackVarMap>::const_iterator tv = other.stack_vars.find(addr);
   const StackVarMap &my_vars = mv == stack_vars.end() ? empty_vars : mv->second;
   const StackVarMap &their_vars = tv == other.stack_vars.end() ? empty_vars : tv->second;
   if (my_vars != their_vars) {
      return false;
   }

   return getComments(addr) == other.getComments(addr);
}

bool State::compareStructs(const State &other) const {
   return structs == other.structs;
}

//take theirs when we have nothing, or when they changed it more recently
template <class K, class T>
static int lww_merge(map<K,T> &mine, const map<K,T> &theirs) {
   int taken = 0;
   for (typename map<K,T>::const_iterator i = theirs.begin(); i != theirs.end(); i++) {
      typename map<K,T>::iterator m = mine.find(i->first);
      if (m == mine.end()) {
         mine[i->first] = i->second;
         taken++;
      }
      else if (i->second.last_change > m->second.last_change) {
         m->second = i->second;
         taken++;
      }
   }
   return taken;
}

int State::merge(const State &other) {
   int taken = lww_merge(functions, other.functions);
   taken += lww_merge(comments, other.comments);
   taken += lww_merge(structs, other.structs);
   for (map<uint64_t,StackVarMap>::const_iterator i = other.stack_vars.begin(); i != other.stack_vars.end(); i++) {
      taken += lww_merge(stack_vars[i->first], i->second);
   }
   if (taken > 0) {
      dirty = true;
   }
   return taken;
}

static void add_file(map<string,string> &files, const string &name, json_object *obj) {
   files[name] = dump_json(obj);
   json_object_put(obj);
}

map<string,string> State::dumpFiles() const {
   map<string,string> files;
   add_file(files, FUNCTIONS_FILE, dump_many(functions));
   add_file(files, COMMENTS_FILE, dump_many(comments));
   add_file(files, STRUCTS_FILE, dump_many(structs));
   for (map<uint64_t,StackVarMap>::const_iterator i = stack_vars.begin(); i != stack_vars.end(); i++) {
      if (i->second.size() > 0) {
         add_file(files, string(STACK_VARS_DIR) + "/" + formatAddr(i->first) + ".json", dump_many(i->second));
      }
   }
   return files;
}

void State::loadFiles(const map<string,string> &files) {
   string prefix = string(STACK_VARS_DIR) + "/";
   for (map<string,string>::const_iterator i = files.begin(); i != files.end(); i++) {
      json_object *obj = parse_json(i->second);
      if (obj == NULL) {
         log(LWARNING, "%s: ignoring unparsable file %s\n", user.c_str(), i->first.c_str());
         continue;
      }
      if (i->first == FUNCTIONS_FILE) {
         vector<Function> v = load_many<Function>(obj);
         for (vector<Function>::iterator f = v.begin(); f != v.end(); f++) {
            functions[f->addr] = *f;
         }
      }
      else if (i->first == COMMENTS_FILE) {
         vector<Comment> v = load_many<Comment>(obj);
         for (vector<Comment>::iterator c = v.begin(); c != v.end(); c++) {
            comments[c->addr] = *c;
         }
      }
      else if (i->first == STRUCTS_FILE) {
         vector<Struct> v = load_many<Struct>(obj);
         for (vector<Struct>::iterator s = v.begin(); s != v.end(); s++) {
            structs[s->name] = *s;
         }
      }
      else if (i->first.compare(0, prefix.length(), prefix) == 0) {
         vector<StackVariable> v = load_many<StackVariable>(obj);
         for (vector<StackVariable>::iterator sv = v.begin(); sv != v.end(); sv++) {
            stack_vars[sv->func_addr][sv->stack_offset] = *sv;
         }
      }
      else {
         log(LDEBUG, "%s: unknown file %s in snapshot\n", user.c_str(), i->first.c_str());
      }
      json_object_put(obj);
   }
}

bool State::save() {
   if (!dirty) {
      return false;
   }
   if (repo == NULL) {
      throw RepositoryException("state for " + user + " is not attached to a repository");
   }
   version = repo->commitSnapshot(user, dumpFiles());
   dirty = false;
   log(LINFO1, "%s: committed version %lld\n", user.c_str(), (long long)version);
   return true;
}
