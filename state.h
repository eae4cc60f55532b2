/*
   syncREate state.h
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

#ifndef __SYNC_STATE_H
#define __SYNC_STATE_H

#include <stdint.h>
#include <string>
#include <vector>
#include <map>

#include "function.h"
#include "comment.h"
#include "stack_variable.h"
#include "structure.h"

using namespace std;

#define FUNCTIONS_FILE   "functions.json"
#define COMMENTS_FILE    "comments.json"
#define STRUCTS_FILE     "structs.json"
#define STACK_VARS_DIR   "stack_vars"

class Repository;

typedef map<int64_t,StackVariable> StackVarMap;

/**
 * State
 * One user's complete snapshot of artifacts at a given version. States are
 * plain values, "the current state of user U" is always re-read from the
 * repository. Only a state handed out for writing is ever saved.
 */
class State {
public:
   State(const string &user = "", int64_t version = -1, Repository *repo = NULL);

   const string &getUser() const {return user;};
   int64_t getVersion() const {return version;};
   bool isDirty() const {return dirty;};

   /**
    * getFunction looks up a function by start address
    * @throws NotFoundException if the function was never recorded
    */
   const Function &getFunction(uint64_t addr) const;
   const map<uint64_t,Function> &getFunctions() const {return functions;};

   /**
    * setFunction records a function, replacing any existing entry
    * @param f the function
    * @param set_last_change stamp the entry with the current time
    */
   void setFunction(const Function &f, bool set_last_change = true);

   const StackVariable &getStackVariable(uint64_t func_addr, int64_t offset) const;
   const StackVarMap &getStackVariables(uint64_t func_addr) const;
   void setStackVariable(const StackVariable &v, int64_t offset, uint64_t func_addr, bool set_last_change = true);

   const Comment &getComment(uint64_t addr) const;

   //every comment that belongs to func_addr, empty if there are none
   map<uint64_t,Comment> getComments(uint64_t func_addr) const;
   const map<uint64_t,Comment> &getAllComments() const {return comments;};
   void setComment(const Comment &c, bool set_last_change = true);

   //removing a comment that does not exist is not an error
   void removeComment(uint64_t addr);

   const Struct &getStruct(const string &name) const;
   vector<Struct> getStructs() const;

   /**
    * setStruct stores a struct definition. When old_name is given and differs
    * from s.name the entry under old_name is dropped and s inserted in its
    * place. A deleted struct (empty name) just drops old_name.
    * @param s the complete struct definition
    * @param old_name the name the struct had before this change, may be empty
    * @param set_last_change stamp the entry with the current time
    */
   void setStruct(const Struct &s, const string &old_name, bool set_last_change = true);

   /**
    * compareFunction checks whether the name, the stack variables and the
    * comments of a function are content equal in this and other. Timestamps
    * play no part in the comparison.
    * @return true if nothing about the function differs
    */
   bool compareFunction(uint64_t addr, const State &other) const;

   /**
    * compareStructs checks that both states hold the same set of struct
    * definitions, again ignoring timestamps
    */
   bool compareStructs(const State &other) const;

   /**
    * merge pulls other's artifacts into this state, last writer wins: an
    * artifact is taken when it is missing here or other changed it later
    * @return the number of artifacts taken from other
    */
   int merge(const State &other);

   //repository layout relative to the user's directory
   map<string,string> dumpFiles() const;
   void loadFiles(const map<string,string> &files);

   /**
    * save commits the complete snapshot when it has changes
    * @return true if a new version was committed
    * @throws RepositoryException if the commit failed, nothing is written
    */
   bool save();

private:
   string user;
   int64_t version;
   Repository *repo;
   bool dirty;

   map<uint64_t,Function> functions;
   map<uint64_t,StackVarMap> stack_vars;
   map<uint64_t,Comment> comments;
   map<string,Struct> structs;
};

#endif
