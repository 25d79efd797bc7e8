#pragma once
#include <string>
#include <variant>
#include <vector>
#include <map>
#include <cstdint>

namespace mfs {
struct JNull{};
class JNode;
using JArr = std::vector<JNode>;
using JObj = std::map<std::string, JNode>;
using JVal = std::variant<JNull, bool, double, std::string, JArr, JObj>;
class JNode { public: JVal v; };

bool json_parse(const std::string& s, JNode& out);
std::string json_dump(const JNode& n);

// Builders
JNode jstr(const std::string& s);
JNode jnum(double d);
JNode jbool(bool b);
JNode jobj(JObj o);
JNode jarr(JArr a);

// Accessors. Lookups on a non-object or a missing key yield nullptr / the fallback.
const JNode* json_get(const JNode& obj, const std::string& key);
bool json_is_obj(const JNode& n);
bool json_is_arr(const JNode& n);
std::string json_str(const JNode& obj, const std::string& key, const std::string& fallback = "");
double json_num(const JNode& obj, const std::string& key, double fallback = 0.0);
int64_t json_int(const JNode& obj, const std::string& key, int64_t fallback = 0);
bool json_bool(const JNode& obj, const std::string& key, bool fallback = false);
// Numbers are stringified without a fractional part when integral.
std::string json_as_string(const JNode& n);
}
