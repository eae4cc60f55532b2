/*
   syncREate utils.cpp
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

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <string.h>
#include <errno.h>
#include <stdint.h>
#include <inttypes.h>
#include <string>
#include <openssl/md5.h>
#include <json-c/json.h>

#include "utils.h"

using std::string;

static FILE *logger = stderr;
static int log_level = DEFAULT_VERBOSITY;

SyncException::SyncException(const string &msg) {
   this->msg = msg;
}

const string &SyncException::getMessage() const {
   return msg;
}

string toHexString(const uint8_t *buf, int len) {
   char hex[16];
   string res = "";
   for (int i = 0; i < len; i++) {
      snprintf(hex, sizeof(hex), "%02x", buf[i]);
      res += hex;
   }
   return res;
}

/**
 * getFileMD5 - md5sum of an entire file, read in blocks
 * @param fname The file to hash
 * @param md5 receives the lower case hex digest
 * @return false if the file could not be read
 */
bool getFileMD5(const string &fname, string &md5) {
   FILE *f = fopen(fname.c_str(), "rb");
   if (f == NULL) {
      log(LERROR, "unable to open %s for hashing: %s\n", fname.c_str(), strerror(errno));
      return false;
   }
   MD5_CTX ctx;
   unsigned char buf[4096];
   uint8_t digest[MD5_DIGEST_LENGTH];
   MD5_Init(&ctx);
   size_t len;
   while ((len = fread(buf, 1, sizeof(buf), f)) > 0) {
      MD5_Update(&ctx, buf, len);
   }
   bool ok = ferror(f) == 0;
   fclose(f);
   MD5_Final(digest, &ctx);
   if (ok) {
      md5 = toHexString(digest, MD5_DIGEST_LENGTH);
   }
   return ok;
}

//addresses are always stored as lower case hex without a 0x prefix
string formatAddr(uint64_t addr) {
   char buf[32];
   snprintf(buf, sizeof(buf), "%" PRIx64, addr);
   return buf;
}

//stack offsets may be negative, render them as -18 rather than two's complement
string formatOffset(int64_t offset) {
   char buf[32];
   if (offset < 0) {
      snprintf(buf, sizeof(buf), "-%" PRIx64, (uint64_t)(-offset));
   }
   else {
      snprintf(buf, sizeof(buf), "%" PRIx64, (uint64_t)offset);
   }
   return buf;
}

bool parseAddr(const char *s, uint64_t *addr) {
   if (s == NULL || *s == 0) {
      return false;
   }
   char *end;
   errno = 0;
   uint64_t val = strtoull(s, &end, 16);
   if (*end != 0 || errno != 0) {
      return false;
   }
   *addr = val;
   return true;
}

bool parseOffset(const char *s, int64_t *offset) {
   if (s == NULL || *s == 0) {
      return false;
   }
   bool neg = *s == '-';
   uint64_t mag;
   if (!parseAddr(neg ? s + 1 : s, &mag)) {
      return false;
   }
   *offset = neg ? -(int64_t)mag : (int64_t)mag;
   return true;
}

bool readFile(const string &fname, string &contents) {
   FILE *f = fopen(fname.c_str(), "rb");
   if (f == NULL) {
      return false;
   }
   char buf[4096];
   size_t len;
   contents.clear();
   while ((len = fread(buf, 1, sizeof(buf), f)) > 0) {
      contents.append(buf, len);
   }
   bool ok = ferror(f) == 0;
   fclose(f);
   return ok;
}

bool writeFile(const string &fname, const string &contents) {
   FILE *f = fopen(fname.c_str(), "wb");
   if (f == NULL) {
      log(LERROR, "unable to create %s: %s\n", fname.c_str(), strerror(errno));
      return false;
   }
   bool ok = fwrite(contents.data(), 1, contents.length(), f) == contents.length();
   ok = fflush(f) == 0 && ok;
   ok = fclose(f) == 0 && ok;
   return ok;
}

void vlog(const char *format, va_list va) {
   vfprintf(logger, format, va);
}

void vlog(int verbosity, const char *format, va_list va) {
   if (verbosity <= log_level) {
      vlog(format, va);
   }
}

void log(int verbosity, const char *format, ...) {
   va_list va;
   va_start(va, format);
   vlog(verbosity, format, va);
   va_end(va);
}

void logln(const string &msg, int verbosity) {
   log(verbosity, "%s\n", msg.c_str());
}

void setLogLevel(int verbosity) {
   log_level = verbosity;
}

int getLogLevel() {
   return log_level;
}

int getIntOption(json_object *conf, const string &opt, int defaultValue) {
   const char *var = getenv(opt.c_str());
   if (var) {
      return strtol(var, NULL, 0);
   }

   json_object *val = NULL;
   if (conf == NULL || !json_object_object_get_ex(conf, opt.c_str(), &val)) {
      return defaultValue;
   }
   else {
      return (int)json_object_get_int(val);
   }
}

string getStringOption(json_object *conf, const string &opt, const char *defaultValue) {
   const char *res = getCstringOption(conf, opt, defaultValue);
   return res ? res : "";
}

const char *getCstringOption(json_object *conf, const string &opt, const char *defaultValue) {
   const char *res = getenv(opt.c_str());
   if (res) {
      return res;
   }

   json_object *val = NULL;
   if (conf == NULL || !json_object_object_get_ex(conf, opt.c_str(), &val)) {
      return defaultValue;
   }
   else {
      return json_object_get_string(val);
   }
}

json_object *parseConf(const char *fname) {
   json_object *conf = json_object_from_file(fname);

   if (conf) {
      const char *logfile = getCstringOption(conf, "LOG_FILE", NULL);
      if (logfile) {
         FILE *f = fopen(logfile, "a");
         if (f) {
            setvbuf(f, NULL, _IONBF, 0);
            logger = f;
         }
      }
      log_level = getIntOption(conf, "LOG_VERBOSITY", DEFAULT_VERBOSITY);
   }
   else {
      log(LERROR, "unable to parse config file %s: %s\n", fname, json_util_get_last_err());
   }

   return conf;
}

void append_json_string_val(json_object *obj, const char *key, const char *value) {
   json_object_object_add_ex(obj, key, json_object_new_string(value), JSON_NEW_CONST_KEY);
}

void append_json_string_val(json_object *obj, const char *key, const string &value) {
   json_object_object_add_ex(obj, key, json_object_new_string_len(value.c_str(), value.length()), JSON_NEW_CONST_KEY);
}

void append_json_bool_val(json_object *obj, const char *key, bool value) {
   json_object_object_add_ex(obj, key, json_object_new_boolean((json_bool)value), JSON_NEW_CONST_KEY);
}

void append_json_uint64_val(json_object *obj, const char *key, uint64_t value) {
   json_object_object_add_ex(obj, key, json_object_new_int64(value), JSON_NEW_CONST_KEY);
}

void append_json_int64_val(json_object *obj, const char *key, int64_t value) {
   json_object_object_add_ex(obj, key, json_object_new_int64(value), JSON_NEW_CONST_KEY);
}

void append_json_uint32_val(json_object *obj, const char *key, uint32_t value) {
   append_json_uint64_val(obj, key, value);
}

void append_json_int32_val(json_object *obj, const char *key, int32_t value) {
   json_object_object_add_ex(obj, key, json_object_new_int(value), JSON_NEW_CONST_KEY);
}

const char *string_from_json(json_object *json, const char *key) {
   json_object *value;

   if (!json_object_object_get_ex(json, key, &value)) {
      return NULL;
   }

   return json_object_get_string(value);
}

bool string_from_json(json_object *json, const char *key, string &val) {
   json_object *value;

   if (!json_object_object_get_ex(json, key, &value) || !json_object_is_type(value, json_type_string)) {
      return false;
   }

   val.assign(json_object_get_string(value), json_object_get_string_len(value));
   return true;
}

bool bool_from_json(json_object *json, const char *key, bool *val) {
   json_object *value;

   if (!json_object_object_get_ex(json, key, &value)) {
      return false;
   }

   *val = (bool)json_object_get_boolean(value);
   return true;
}

bool uint64_from_json(json_object *json, const char *key, uint64_t *val) {
   json_object *value;

   if (!json_object_object_get_ex(json, key, &value)) {
      return false;
   }

   *val = (uint64_t)json_object_get_int64(value);
   return true;
}

bool int64_from_json(json_object *json, const char *key, int64_t *val) {
   json_object *value;

   if (!json_object_object_get_ex(json, key, &value)) {
      return false;
   }

   *val = json_object_get_int64(value);
   return true;
}

bool uint32_from_json(json_object *json, const char *key, uint32_t *val) {
   uint64_t tmp;
   if (uint64_from_json(json, key, &tmp)) {
      *val = (uint32_t)tmp;
      return true;
   }
   return false;
}

bool int32_from_json(json_object *json, const char *key, int32_t *val) {
   json_object *value;

   if (!json_object_object_get_ex(json, key, &value)) {
      return false;
   }

   *val = (int32_t)json_object_get_int(value);
   return true;
}

const char *json_text(json_object *obj) {
   if (obj == NULL) {
      return "null";
   }
   return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}
