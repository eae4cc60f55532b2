/*
   syncREate utils.h
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

#ifndef __SYNC_UTILS_H
#define __SYNC_UTILS_H

#include <stdint.h>
#include <string>
#include <vector>
#include <map>
#include <json-c/json.h>

using namespace std;

#define PLUGIN_NAME "syncREate"

#define JSON_NEW_CONST_KEY (JSON_C_OBJECT_ADD_KEY_IS_NEW | JSON_C_OBJECT_KEY_IS_CONSTANT)


#define DEFAULT_VERBOSITY 3

#define LERROR   0
#define LWARNING 1
#define LINFO    3
#define LINFO1   4
#define LINFO2   5
#define LINFO3   6
#define LINFO4   7
#define LDEBUG   15

/**
 * sentinel for an artifact that was never changed by any user
 */
#define NEVER_CHANGED ((int64_t)-1)

void log(int verbosity, const char *format, ...);
void logln(const string &msg, int verbosity = 0);
void setLogLevel(int verbosity);
int getLogLevel();

class SyncException {
public:
   SyncException(const string &msg = "");
   virtual ~SyncException() {};
   const string &getMessage() const;
private:
   string msg;
};

//state operation attempted before a successful connect
class NotConnectedException : public SyncException {
public:
   NotConnectedException(const string &msg = "Please connect to a repo first.") : SyncException(msg) {};
};

//missing function / offset / comment / struct
class NotFoundException : public SyncException {
public:
   NotFoundException(const string &msg = "") : SyncException(msg) {};
};

//type string can't be mapped to a host tool type
class TypeConversionException : public SyncException {
public:
   TypeConversionException(const string &msg = "") : SyncException(msg) {};
};

//stack offsets between incompatible conventions
class UnsupportedOffsetConversion : public SyncException {
public:
   UnsupportedOffsetConversion(const string &msg = "") : SyncException(msg) {};
};

class RepositoryException : public SyncException {
public:
   RepositoryException(const string &msg = "") : SyncException(msg) {};
};

//the registered info surface has been closed
class SurfaceClosedException : public SyncException {
public:
   SurfaceClosedException(const string &msg = "") : SyncException(msg) {};
};

string toHexString(const uint8_t *buf, int len);
bool getFileMD5(const string &fname, string &md5);

string formatAddr(uint64_t addr);
string formatOffset(int64_t offset);
bool parseAddr(const char *s, uint64_t *addr);
bool parseOffset(const char *s, int64_t *offset);

bool readFile(const string &fname, string &contents);
bool writeFile(const string &fname, const string &contents);

json_object *parseConf(const char *conf);
int getIntOption(json_object *conf, const string &opt, int defaultValue);
string getStringOption(json_object *conf, const string &opt, const char *defaultValue);
const char *getCstringOption(json_object *conf, const string &opt, const char *defaultValue);

void append_json_string_val(json_object *obj, const char *key, const char *value);
void append_json_string_val(json_object *obj, const char *key, const string &value);
void append_json_bool_val(json_object *obj, const char *key, bool value);
void append_json_uint64_val(json_object *obj, const char *key, uint64_t value);
void append_json_int64_val(json_object *obj, const char *key, int64_t value);
void append_json_uint32_val(json_object *obj, const char *key, uint32_t value);
void append_json_int32_val(json_object *obj, const char *key, int32_t value);

const char *string_from_json(json_object *json, const char *key);
bool string_from_json(json_object *json, const char *key, string &val);
bool bool_from_json(json_object *json, const char *key, bool *val);
bool uint64_from_json(json_object *json, const char *key, uint64_t *val);
bool int64_from_json(json_object *json, const char *key, int64_t *val);
bool uint32_from_json(json_object *json, const char *key, uint32_t *val);
bool int32_from_json(json_object *json, const char *key, int32_t *val);

//plain text rendering, caller does not free
const char *json_text(json_object *obj);

#endif
